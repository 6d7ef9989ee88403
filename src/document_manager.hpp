/* document_manager.hpp - document management header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "document.hpp"
#include "extractor.hpp"
#include "layout_config.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <wx/string.h>

// True when the path names an ALTO description rather than a PDF.
[[nodiscard]] bool is_alto_path(const wxString& path);
// Raw ALTO XML for a file: read directly for descriptions, produced by the extractor for PDFs.
[[nodiscard]] std::string load_alto(const wxString& path, const extractor_options& options);
// Parses and resolves a file. Throws layout_exception.
[[nodiscard]] std::unique_ptr<document> load_document(const wxString& path, const layout_config& layout, const extractor_options& options);

class document_manager {
public:
	document_manager(config_manager& cfg, const layout_config& layout, extractor_options options);
	~document_manager();
	document_manager(const document_manager&) = delete;
	document_manager& operator=(const document_manager&) = delete;
	document_manager(document_manager&&) = delete;
	document_manager& operator=(document_manager&&) = delete;
	// Replaces the current document; the previous one stays open if loading fails.
	void open_file(const wxString& path);
	void reload();
	void close_document();
	// Raw ALTO XML of the open file, extracted again for PDFs.
	[[nodiscard]] std::string read_alto() const;

	[[nodiscard]] bool has_document() const noexcept {
		return doc != nullptr;
	}

	[[nodiscard]] const document* get_document() const noexcept {
		return doc.get();
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] std::size_t get_page_index() const noexcept {
		return page_index;
	}

	[[nodiscard]] const layout_config& get_layout() const noexcept {
		return layout;
	}

	[[nodiscard]] const page* get_current_page() const noexcept;
	[[nodiscard]] std::size_t get_page_count() const noexcept;
	bool go_to_page(std::size_t index);
	bool go_to_next_page();
	bool go_to_previous_page();
	bool go_to_first_page();
	bool go_to_last_page();
	void save_document_position() const;
	[[nodiscard]] wxString get_status_text() const;

private:
	config_manager& config;
	layout_config layout;
	extractor_options options;
	std::unique_ptr<document> doc;
	wxString file_path;
	std::size_t page_index{0};

	void restore_document_position();
};
