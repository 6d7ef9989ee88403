/* alto_parser.hpp - ALTO layout description parser header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>

// Builds a document from the ALTO XML written by pdfalto.
// Elements are matched by local name, so namespace prefixes and ALTO schema versions do not matter.
class alto_parser {
public:
	explicit alto_parser(const wxString& source_path = wxEmptyString) : source_path{source_path} {
	}
	~alto_parser() = default;
	alto_parser(const alto_parser&) = delete;
	alto_parser& operator=(const alto_parser&) = delete;
	alto_parser(alto_parser&&) = default;
	alto_parser& operator=(alto_parser&&) = default;
	[[nodiscard]] std::unique_ptr<document> parse(const std::string& xml_content);

private:
	struct page_state {
		page pg;
		std::optional<double> declared_width;
		std::optional<double> declared_height;
		std::optional<double> line_baseline;
	};

	wxString source_path;
	std::unique_ptr<document> doc;
	std::optional<page_state> current;
	std::size_t next_hint{0};
	std::size_t strings_seen{0};
	std::size_t strings_bad_encoding{0};
	bool any_geometry{false};

	void reset();
	void process_node(pugi::xml_node node);
	void begin_page(pugi::xml_node node);
	void end_page();
	void process_string(pugi::xml_node node);
	void add_warning(warning_kind kind, std::string message);
	[[noreturn]] void fail(const wxString& message, parse_error_code code) const;
	[[nodiscard]] static std::string get_local_name(const char* qname);
	[[nodiscard]] static std::optional<double> numeric_attribute(pugi::xml_node node, const char* name);
};

[[nodiscard]] std::unique_ptr<document> parse_alto(const std::string& xml_content, const wxString& source_path = wxEmptyString);
// Raw bytes of a description file. Throws layout_exception (conversion) when unreadable or empty.
[[nodiscard]] std::string read_alto_file(const wxString& path);
[[nodiscard]] std::unique_ptr<document> parse_alto_file(const wxString& path);
// Re-indents the description for display; returns the input unchanged when it is not well-formed.
[[nodiscard]] std::string format_alto(const std::string& xml_content);
