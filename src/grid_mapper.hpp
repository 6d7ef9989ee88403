/* grid_mapper.hpp - grid mapper header file.
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
#include "layout_error.hpp"
#include "terminal_grid.hpp"
#include <cstdint>
#include <vector>

struct grid_scale {
	double x{0.0};
	double y{0.0};
};

struct grid_position {
	std::uint32_t row{0};
	std::uint32_t col{0};
};

struct map_result {
	terminal_grid grid;
	std::vector<layout_warning> warnings;
};

// Page units to cells, with the cell aspect correction applied to the vertical scale.
[[nodiscard]] grid_scale compute_scale(double page_width, double page_height, std::uint32_t rows, std::uint32_t cols, const layout_config& config) noexcept;
// Rows needed to show the whole page at the horizontal scale without vertical compression.
[[nodiscard]] std::uint32_t natural_rows(const page& pg, std::uint32_t cols, const layout_config& config) noexcept;
// Cell where a box's text starts. Requires rows and cols greater than zero.
[[nodiscard]] grid_position map_box(const bounding_box& box, const grid_scale& scale, std::uint32_t rows, std::uint32_t cols, const layout_config& config) noexcept;
// Places every resolved word of the page on a rows x cols grid. Never fails.
[[nodiscard]] map_result map_page(const page& pg, std::uint32_t rows, std::uint32_t cols, const layout_config& config);
