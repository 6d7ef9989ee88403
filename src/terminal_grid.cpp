/* terminal_grid.cpp - character grid implementation.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "terminal_grid.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

terminal_grid::terminal_grid(std::uint32_t rows, std::uint32_t cols) : row_count{rows}, col_count{cols}, cells(static_cast<std::size_t>(rows) * cols) {
}

cell& terminal_grid::at(std::uint32_t row, std::uint32_t col) {
	if (row >= row_count || col >= col_count) {
		throw std::out_of_range("terminal_grid cell out of range");
	}
	return cells[static_cast<std::size_t>(row) * col_count + col];
}

const cell& terminal_grid::at(std::uint32_t row, std::uint32_t col) const {
	if (row >= row_count || col >= col_count) {
		throw std::out_of_range("terminal_grid cell out of range");
	}
	return cells[static_cast<std::size_t>(row) * col_count + col];
}

std::u32string terminal_grid::row_chars(std::uint32_t row) const {
	std::u32string chars;
	chars.reserve(col_count);
	for (std::uint32_t col = 0; col < col_count; ++col) {
		chars.push_back(at(row, col).ch);
	}
	return chars;
}

std::string terminal_grid::row_text(std::uint32_t row) const {
	return from_code_points(row_chars(row));
}

bool terminal_grid::row_blank(std::uint32_t row) const {
	for (std::uint32_t col = 0; col < col_count; ++col) {
		if (!at(row, col).blank()) {
			return false;
		}
	}
	return true;
}

bool terminal_grid::all_blank() const noexcept {
	return std::ranges::all_of(cells, [](const cell& c) {
		return c.blank();
	});
}

std::string terminal_grid::to_string() const {
	std::string out;
	for (std::uint32_t row = 0; row < row_count; ++row) {
		auto chars = row_chars(row);
		const auto last = chars.find_last_not_of(U' ');
		chars.erase(last == std::u32string::npos ? 0 : last + 1);
		out += from_code_points(chars);
		out += '\n';
	}
	return out;
}

terminal_grid message_grid(std::uint32_t rows, std::uint32_t cols, std::string_view text) {
	terminal_grid grid{rows, cols};
	if (rows == 0 || cols == 0) {
		return grid;
	}
	std::vector<std::u32string> lines;
	std::u32string current;
	for (const char32_t ch : to_code_points(text)) {
		if (ch == U'\n') {
			lines.push_back(current);
			current.clear();
			continue;
		}
		current.push_back(ch);
		if (current.size() <= cols) {
			continue;
		}
		// Break at the last space that fits, or hard-break a word longer than the row.
		const auto space = current.find_last_of(U' ', cols);
		if (space != std::u32string::npos && space > 0) {
			lines.push_back(current.substr(0, space));
			current.erase(0, space + 1);
		} else {
			lines.push_back(current.substr(0, cols));
			current.erase(0, cols);
		}
	}
	if (!current.empty()) {
		lines.push_back(current);
	}
	const auto shown = static_cast<std::uint32_t>(std::min<std::size_t>(lines.size(), rows));
	const std::uint32_t top = (rows - shown) / 2;
	for (std::uint32_t i = 0; i < shown; ++i) {
		const auto& line = lines[i];
		const auto width = static_cast<std::uint32_t>(std::min<std::size_t>(line.size(), cols));
		const std::uint32_t left = (cols - width) / 2;
		for (std::uint32_t c = 0; c < width; ++c) {
			auto& target = grid.at(top + i, left + c);
			target.ch = line[c];
			target.is_fragment_start = c == 0;
		}
	}
	return grid;
}

terminal_grid text_grid(std::string_view text, std::uint32_t min_rows, std::uint32_t cols, std::uint32_t max_rows) {
	std::vector<std::u32string> lines(1);
	for (const char32_t ch : to_code_points(text)) {
		if (ch == U'\n') {
			lines.emplace_back();
		} else if (ch == U'\t' || ch == U'\f') {
			lines.back().push_back(U' ');
		} else if (ch >= U' ' && ch != U'\x7f') {
			lines.back().push_back(ch);
		}
	}
	if (lines.size() > 1 && lines.back().empty()) {
		lines.pop_back();
	}
	const auto wanted = std::max<std::size_t>(min_rows, lines.size());
	const auto rows = static_cast<std::uint32_t>(std::min<std::size_t>(wanted, max_rows));
	terminal_grid grid{rows, cols};
	const auto shown = std::min<std::size_t>(lines.size(), rows);
	for (std::uint32_t row = 0; row < shown; ++row) {
		const auto& line = lines[row];
		const auto width = static_cast<std::uint32_t>(std::min<std::size_t>(line.size(), cols));
		for (std::uint32_t col = 0; col < width; ++col) {
			auto& target = grid.at(row, col);
			target.ch = line[col];
			target.is_fragment_start = col == 0;
		}
	}
	return grid;
}
