/* layout_error.cpp - layout error and warning names.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "layout_error.hpp"

const char* warning_kind_name(warning_kind kind) noexcept {
	switch (kind) {
		case warning_kind::geometry_defaulted:
			return "geometry defaulted";
		case warning_kind::fragment_clamped:
			return "fragment clamped";
		case warning_kind::invalid_encoding:
			return "invalid encoding";
		case warning_kind::degenerate_clustering:
			return "degenerate clustering";
		case warning_kind::overlapping_word_dropped:
			return "overlapping word dropped";
		case warning_kind::word_clipped:
			return "word clipped";
	}
	return "unknown";
}

const char* parse_error_code_name(parse_error_code code) noexcept {
	switch (code) {
		case parse_error_code::none:
			return "none";
		case parse_error_code::malformed_structure:
			return "malformed structure";
		case parse_error_code::missing_geometry:
			return "missing geometry";
		case parse_error_code::encoding_error:
			return "encoding error";
	}
	return "unknown";
}
