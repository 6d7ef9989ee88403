/* text_export.cpp - plain text export of resolved pages.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_export.hpp"
#include "reading_order.hpp"
#include <algorithm>
#include <cmath>
#include <span>
#include <string>

std::string page_text(const page& pg, const layout_config& config) {
	std::string text;
	const double space_gap = config.space_threshold * median_char_width(std::span<const word>(pg.words));
	const reconstructed_line* previous = nullptr;
	for (const auto& line : pg.lines) {
		if (previous != nullptr) {
			const double height = previous->bbox.height;
			const double gap = line.bbox.y - previous->bbox.bottom();
			if (height > 0.0 && gap > config.paragraph_gap_factor * height) {
				const int blanks = std::clamp(static_cast<int>(gap / height), 1, std::max(1, config.max_blank_lines));
				text.append(static_cast<std::size_t>(blanks), '\n');
			}
		}
		text += line_text(pg, line, space_gap);
		text += '\n';
		previous = &line;
	}
	return text;
}

std::string document_text(const document& doc, const layout_config& config) {
	std::string text;
	for (const auto& pg : doc.pages) {
		if (&pg != &doc.pages.front()) {
			text += '\f';
		}
		text += page_text(pg, config);
	}
	return text;
}
