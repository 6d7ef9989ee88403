/* layout_error.hpp - layout exception and warning types.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <wx/string.h>

enum class error_kind {
	conversion,
	parse
};

enum class parse_error_code {
	none,
	malformed_structure,
	missing_geometry,
	encoding_error
};

class layout_exception : public std::runtime_error {
public:
	layout_exception(const wxString& msg, error_kind kind, parse_error_code code = parse_error_code::none) : std::runtime_error(msg.ToStdString()), message{msg}, kind{kind}, error_code{code} {
	}
	layout_exception(const wxString& msg, const wxString& fp, error_kind kind, parse_error_code code = parse_error_code::none) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp}, kind{kind}, error_code{code} {
	}

	[[nodiscard]] error_kind get_kind() const noexcept {
		return kind;
	}

	[[nodiscard]] parse_error_code get_error_code() const noexcept {
		return error_code;
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", file_path, message);
	}

private:
	wxString message;
	wxString file_path;
	error_kind kind;
	parse_error_code error_code;
};

enum class warning_kind {
	geometry_defaulted,
	fragment_clamped,
	invalid_encoding,
	degenerate_clustering,
	overlapping_word_dropped,
	word_clipped
};

struct layout_warning {
	warning_kind kind;
	std::uint32_t page_index{0};
	std::string message;
};

[[nodiscard]] const char* warning_kind_name(warning_kind kind) noexcept;
[[nodiscard]] const char* parse_error_code_name(parse_error_code code) noexcept;
