/* terminal_grid.hpp - character grid header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct cell {
	char32_t ch{U' '};
	// Set on the first cell written for a word.
	bool is_fragment_start{false};

	[[nodiscard]] bool blank() const noexcept {
		return ch == U' ';
	}

	[[nodiscard]] bool operator==(const cell& other) const noexcept = default;
};

// A rows x cols character grid; every cell starts blank.
class terminal_grid {
public:
	terminal_grid() = default;
	terminal_grid(std::uint32_t rows, std::uint32_t cols);

	[[nodiscard]] std::uint32_t rows() const noexcept {
		return row_count;
	}

	[[nodiscard]] std::uint32_t cols() const noexcept {
		return col_count;
	}

	[[nodiscard]] cell& at(std::uint32_t row, std::uint32_t col);
	[[nodiscard]] const cell& at(std::uint32_t row, std::uint32_t col) const;
	[[nodiscard]] std::u32string row_chars(std::uint32_t row) const;
	// UTF-8 text of one row, trailing blanks kept.
	[[nodiscard]] std::string row_text(std::uint32_t row) const;
	[[nodiscard]] bool row_blank(std::uint32_t row) const;
	[[nodiscard]] bool all_blank() const noexcept;
	// Rows joined by newlines with trailing blanks trimmed.
	[[nodiscard]] std::string to_string() const;

private:
	std::uint32_t row_count{0};
	std::uint32_t col_count{0};
	std::vector<cell> cells;
};

// Grid holding a short diagnostic, word-wrapped to the width and centered vertically.
[[nodiscard]] terminal_grid message_grid(std::uint32_t rows, std::uint32_t cols, std::string_view text);
// Grid holding text line by line from the top-left corner, clipped at the right edge.
// Has at least min_rows rows and at most max_rows; lines past max_rows are dropped.
[[nodiscard]] terminal_grid text_grid(std::string_view text, std::uint32_t min_rows, std::uint32_t cols, std::uint32_t max_rows);
