/* document.hpp - page and document model header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "geometry.hpp"
#include "layout_error.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <wx/string.h>

// A word-level text unit as read from the extractor, before reading-order inference.
struct raw_fragment {
	bounding_box bbox;
	std::string text;
	double baseline{0.0};
	// Position in the description's document order. Only a hint.
	std::size_t hint_order{0};
};

struct word {
	bounding_box bbox;
	std::string text;
	double baseline{0.0};
	std::size_t hint_order{0};
};

// A reading-order line; its words are page.words[first_word, first_word + word_count).
struct reconstructed_line {
	bounding_box bbox;
	std::size_t first_word{0};
	std::size_t word_count{0};
	int reading_rank{0};
	// Column group index, or -1 for a band spanning a column boundary.
	int column{0};
};

struct page {
	std::uint32_t index{0};
	double width{0.0};
	double height{0.0};
	std::vector<raw_fragment> fragments;
	std::vector<word> words;
	std::vector<reconstructed_line> lines;
	std::vector<layout_warning> warnings;
	bool resolved{false};

	[[nodiscard]] std::span<const word> line_words(const reconstructed_line& line) const noexcept {
		return std::span<const word>(words).subspan(line.first_word, line.word_count);
	}

	[[nodiscard]] bool empty() const noexcept {
		return fragments.empty() && lines.empty();
	}
};

struct document {
	wxString source_path;
	wxString title{"Untitled"};
	std::vector<page> pages;

	document() = default;
	~document() = default;
	document(const document&) = delete;
	document& operator=(const document&) = delete;
	document(document&&) = default;
	document& operator=(document&&) = default;

	[[nodiscard]] std::size_t page_count() const noexcept {
		return pages.size();
	}

	[[nodiscard]] std::size_t fragment_count() const noexcept;
	[[nodiscard]] std::size_t warning_count() const noexcept;
	[[nodiscard]] std::vector<layout_warning> all_warnings() const;
	[[nodiscard]] bool fully_resolved() const noexcept;
};
