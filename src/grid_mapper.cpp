/* grid_mapper.cpp - maps resolved pages onto character grids.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "grid_mapper.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <wx/log.h>

namespace {
struct placement {
	grid_position pos;
	double x{0.0};
	int rank{0};
	const word* source{nullptr};
};

std::uint32_t clamp_cell(double value, std::uint32_t limit) noexcept {
	if (!(value > 0.0)) {
		return 0;
	}
	const double floored = std::floor(value);
	if (floored >= static_cast<double>(limit - 1)) {
		return limit - 1;
	}
	return static_cast<std::uint32_t>(floored);
}
} // namespace

grid_scale compute_scale(double page_width, double page_height, std::uint32_t rows, std::uint32_t cols, const layout_config& config) noexcept {
	grid_scale scale;
	if (page_width <= 0.0 || page_height <= 0.0) {
		return scale;
	}
	scale.x = cols / page_width;
	const double stretched = rows / page_height;
	if (config.aspect == aspect_mode::fit || config.cell_aspect_ratio <= 0.0) {
		scale.y = stretched;
	} else {
		scale.y = std::min(stretched, scale.x / config.cell_aspect_ratio);
	}
	return scale;
}

std::uint32_t natural_rows(const page& pg, std::uint32_t cols, const layout_config& config) noexcept {
	if (pg.width <= 0.0 || pg.height <= 0.0 || config.cell_aspect_ratio <= 0.0) {
		return 0;
	}
	const double scale_x = cols / pg.width;
	const double limit = std::max(1, config.max_natural_rows);
	return static_cast<std::uint32_t>(std::min(std::ceil(pg.height * scale_x / config.cell_aspect_ratio), limit));
}

grid_position map_box(const bounding_box& box, const grid_scale& scale, std::uint32_t rows, std::uint32_t cols, const layout_config& config) noexcept {
	const double anchor_x = config.anchor == column_anchor::left ? box.x : box.center_x();
	return {clamp_cell(box.center_y() * scale.y, rows), clamp_cell(anchor_x * scale.x, cols)};
}

map_result map_page(const page& pg, std::uint32_t rows, std::uint32_t cols, const layout_config& config) {
	map_result result{.grid = terminal_grid{rows, cols}, .warnings = {}};
	if (rows == 0 || cols == 0 || pg.lines.empty()) {
		return result;
	}
	const auto scale = compute_scale(pg.width, pg.height, rows, cols, config);
	std::vector<placement> placements;
	placements.reserve(pg.words.size());
	for (const auto& line : pg.lines) {
		for (const auto& w : pg.line_words(line)) {
			placements.push_back({map_box(w.bbox, scale, rows, cols, config), w.bbox.x, line.reading_rank, &w});
		}
	}
	std::ranges::sort(placements, [](const placement& a, const placement& b) {
		if (a.pos.row != b.pos.row) {
			return a.pos.row < b.pos.row;
		}
		if (a.x != b.x) {
			return a.x < b.x;
		}
		return a.rank < b.rank;
	});
	std::uint32_t current_row = rows;
	// One past the last column written on the current row.
	std::uint32_t row_end = 0;
	for (const auto& p : placements) {
		if (p.pos.row != current_row) {
			current_row = p.pos.row;
			row_end = 0;
		}
		std::uint32_t start = p.pos.col;
		if (row_end > 0 && start <= row_end) {
			start = row_end + 1;
		}
		const auto text = to_code_points(p.source->text);
		if (start >= cols) {
			result.warnings.push_back({.kind = warning_kind::word_clipped, .page_index = pg.index, .message = "\"" + p.source->text + "\" does not fit on its row"});
			continue;
		}
		const auto available = cols - start;
		const auto written = static_cast<std::uint32_t>(std::min<std::size_t>(text.size(), available));
		if (written < text.size()) {
			result.warnings.push_back({.kind = warning_kind::word_clipped, .page_index = pg.index, .message = "\"" + p.source->text + "\" clipped at the right edge"});
		}
		for (std::uint32_t i = 0; i < written; ++i) {
			auto& target = result.grid.at(current_row, start + i);
			target.ch = text[i];
			target.is_fragment_start = i == 0;
		}
		row_end = start + written;
	}
	if (!result.warnings.empty()) {
		wxLogVerbose("Page %u: %zu words clipped on a %ux%u grid", pg.index + 1, result.warnings.size(), rows, cols);
	}
	return result;
}
