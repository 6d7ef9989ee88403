/* document.cpp - page and document model.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document.hpp"
#include <algorithm>
#include <cstddef>
#include <vector>

std::size_t document::fragment_count() const noexcept {
	std::size_t count{0};
	for (const auto& pg : pages) {
		count += pg.resolved ? pg.words.size() : pg.fragments.size();
	}
	return count;
}

std::size_t document::warning_count() const noexcept {
	std::size_t count{0};
	for (const auto& pg : pages) {
		count += pg.warnings.size();
	}
	return count;
}

std::vector<layout_warning> document::all_warnings() const {
	std::vector<layout_warning> result;
	result.reserve(warning_count());
	for (const auto& pg : pages) {
		result.insert(result.end(), pg.warnings.begin(), pg.warnings.end());
	}
	return result;
}

bool document::fully_resolved() const noexcept {
	return std::ranges::all_of(pages, [](const page& pg) {
		return pg.resolved;
	});
}
