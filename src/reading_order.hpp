/* reading_order.hpp - reading order resolver header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include "layout_config.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

struct resolve_result {
	std::vector<word> words;
	std::vector<reconstructed_line> lines;
	std::vector<layout_warning> warnings;
};

// x range of an empty vertical strip separating two column groups.
struct column_boundary {
	double left{0.0};
	double right{0.0};

	[[nodiscard]] constexpr double middle() const noexcept {
		return (left + right) / 2.0;
	}
};

// Pure: the same fragments and config always give the same lines and ranks.
[[nodiscard]] resolve_result resolve_fragments(std::span<const raw_fragment> fragments, std::uint32_t page_index, const layout_config& config);
// Replaces the page's fragments with reading-order words and lines.
void resolve_page(page& pg, const layout_config& config);
void resolve_document(document& doc, const layout_config& config);
[[nodiscard]] std::vector<column_boundary> find_column_boundaries(std::span<const raw_fragment> fragments, const layout_config& config);
[[nodiscard]] double median_char_width(std::span<const raw_fragment> fragments);
[[nodiscard]] double median_char_width(std::span<const word> words);
[[nodiscard]] std::string line_text(const page& pg, const reconstructed_line& line, const layout_config& config);
[[nodiscard]] std::string line_text(const page& pg, const reconstructed_line& line, double space_gap);
