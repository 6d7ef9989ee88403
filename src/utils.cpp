/* utils.cpp - misc helper functions.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <wx/string.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
} // namespace

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		// Check for non-breaking space (UTF-8: 0xC2A0)
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i;
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	while (start != end && std::isspace(static_cast<unsigned char>(*start)) != 0) {
		++start;
	}
	while (start != end && std::isspace(static_cast<unsigned char>(*std::prev(end))) != 0) {
		--end;
	}
	return {start, end};
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::size_t utf8_length(std::string_view input) noexcept {
	std::size_t length{0};
	for (const char ch : input) {
		// Count every byte except continuation bytes (10xxxxxx).
		if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
			++length;
		}
	}
	return length;
}

bool is_valid_utf8(std::string_view input) {
	if (input.empty()) {
		return true;
	}
	// wxString yields an empty string when the conversion fails.
	return !wxString::FromUTF8(input.data(), input.size()).empty();
}

std::u32string to_code_points(std::string_view utf8) {
	std::u32string result;
	const wxString text = to_wx(utf8);
	result.reserve(text.length());
	for (const wxUniChar ch : text) {
		result.push_back(static_cast<char32_t>(ch.GetValue()));
	}
	return result;
}

std::string from_code_points(std::u32string_view text) {
	wxString result;
	result.reserve(text.size());
	for (const char32_t ch : text) {
		result += wxUniChar(static_cast<wxUint32>(ch));
	}
	return std::string(result.utf8_str());
}

std::optional<double> parse_number(std::string_view text) {
	const wxString str = wxString::FromUTF8(text.data(), text.size()).Trim(true).Trim(false);
	if (str.empty()) {
		return std::nullopt;
	}
	double value{0.0};
	if (!str.ToCDouble(&value) || !std::isfinite(value)) {
		return std::nullopt;
	}
	return value;
}

wxString to_wx(std::string_view utf8) {
	return wxString::FromUTF8(utf8.data(), utf8.size());
}
