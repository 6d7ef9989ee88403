/* test_helpers.hpp - shared fixtures for the unit tests.
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
#include <string>
#include <utility>
#include <vector>

inline raw_fragment make_fragment(std::string text, double x, double y, double width, double height, std::size_t hint = 0) {
	raw_fragment frag;
	frag.bbox = {x, y, width, height};
	frag.text = std::move(text);
	frag.baseline = y + height;
	frag.hint_order = hint;
	return frag;
}

// Numbers hint orders in the given sequence.
inline page make_page(double width, double height, std::vector<raw_fragment> fragments) {
	page pg;
	pg.width = width;
	pg.height = height;
	for (std::size_t i = 0; i < fragments.size(); ++i) {
		fragments[i].hint_order = i;
	}
	pg.fragments = std::move(fragments);
	return pg;
}

inline std::vector<std::string> line_texts(const page& pg) {
	std::vector<std::string> texts;
	for (const auto& line : pg.lines) {
		std::string text;
		for (const auto& w : pg.line_words(line)) {
			if (!text.empty()) {
				text += ' ';
			}
			text += w.text;
		}
		texts.push_back(text);
	}
	return texts;
}
