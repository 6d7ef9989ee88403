/* reading_order.cpp - line and column reconstruction.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "reading_order.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>

namespace {
struct band {
	std::vector<std::size_t> members;
	bounding_box bbox;
};

struct segment {
	std::size_t band_index;
	bounding_box bbox;
};

struct line_piece {
	std::vector<std::size_t> members;
	bounding_box bbox;
	int column{0};
	std::size_t first_hint{0};
};

// Caps the coverage profile so pages in fine-grained units stay cheap.
constexpr double MAX_PROFILE_BINS = 8192.0;

template <typename T>
double median_width_of(std::span<const T> items) {
	std::vector<double> widths;
	widths.reserve(items.size());
	for (const auto& item : items) {
		const auto length = utf8_length(item.text);
		if (length > 0 && item.bbox.width > 0.0) {
			widths.push_back(item.bbox.width / static_cast<double>(length));
		}
	}
	if (widths.empty()) {
		return 0.0;
	}
	const auto mid = widths.begin() + static_cast<std::ptrdiff_t>(widths.size() / 2);
	std::nth_element(widths.begin(), mid, widths.end());
	if (widths.size() % 2 == 1) {
		return *mid;
	}
	const double upper = *mid;
	const double lower = *std::max_element(widths.begin(), mid);
	return (lower + upper) / 2.0;
}

double fragment_height(const raw_fragment& frag, const layout_config& config) {
	return std::max(frag.bbox.height, config.min_fragment_height);
}

bool is_degenerate(std::span<const raw_fragment> fragments) {
	if (fragments.size() < 2) {
		return false;
	}
	const double cx = fragments.front().bbox.center_x();
	const double cy = fragments.front().bbox.center_y();
	return std::ranges::all_of(fragments, [cx, cy](const raw_fragment& frag) {
		return frag.bbox.center_x() == cx && frag.bbox.center_y() == cy;
	});
}

void sort_left_to_right(std::vector<std::size_t>& members, std::span<const raw_fragment> fragments) {
	std::ranges::sort(members, [&fragments](std::size_t a, std::size_t b) {
		const auto& fa = fragments[a];
		const auto& fb = fragments[b];
		if (fa.bbox.x != fb.bbox.x) {
			return fa.bbox.x < fb.bbox.x;
		}
		return fa.hint_order < fb.hint_order;
	});
}

std::vector<band> build_bands(std::span<const raw_fragment> fragments, const layout_config& config) {
	std::vector<std::size_t> order(fragments.size());
	std::iota(order.begin(), order.end(), std::size_t{0});
	std::ranges::sort(order, [&fragments](std::size_t a, std::size_t b) {
		const auto& fa = fragments[a];
		const auto& fb = fragments[b];
		if (fa.bbox.center_y() != fb.bbox.center_y()) {
			return fa.bbox.center_y() < fb.bbox.center_y();
		}
		if (fa.bbox.x != fb.bbox.x) {
			return fa.bbox.x < fb.bbox.x;
		}
		return fa.hint_order < fb.hint_order;
	});
	std::vector<band> bands;
	for (const std::size_t idx : order) {
		const auto& frag = fragments[idx];
		const double cy = frag.bbox.center_y();
		const double height = fragment_height(frag, config);
		band* target = nullptr;
		for (auto it = bands.rbegin(); it != bands.rend() && target == nullptr; ++it) {
			for (const std::size_t member : it->members) {
				const auto& other = fragments[member];
				const double tolerance = config.band_tolerance * std::min(height, fragment_height(other, config));
				if (std::abs(cy - other.bbox.center_y()) < tolerance) {
					target = &*it;
					break;
				}
			}
		}
		if (target != nullptr) {
			target->members.push_back(idx);
			target->bbox = target->bbox.united(frag.bbox);
		} else {
			bands.push_back({.members = {idx}, .bbox = frag.bbox});
		}
	}
	for (auto& b : bands) {
		sort_left_to_right(b.members, fragments);
	}
	return bands;
}

// Splits every band wherever its words are further apart than a column gap.
std::vector<segment> build_segments(const std::vector<band>& bands, std::span<const raw_fragment> fragments, double gap) {
	std::vector<segment> segments;
	for (std::size_t i = 0; i < bands.size(); ++i) {
		const auto& members = bands[i].members;
		bounding_box current = fragments[members.front()].bbox;
		for (std::size_t m = 1; m < members.size(); ++m) {
			const auto& box = fragments[members[m]].bbox;
			if (box.x - current.right() > gap) {
				segments.push_back({i, current});
				current = box;
			} else {
				current = current.united(box);
			}
		}
		segments.push_back({i, current});
	}
	return segments;
}

std::vector<column_boundary> detect_boundaries(std::span<const raw_fragment> fragments, const std::vector<band>& bands, const layout_config& config, double char_width) {
	const auto min_lines = static_cast<std::size_t>(std::max(1, config.min_column_lines));
	const double gap = config.column_gap_factor * char_width;
	if (fragments.empty() || bands.size() < min_lines || gap <= 0.0) {
		return {};
	}
	double content_left = fragments.front().bbox.x;
	double content_right = fragments.front().bbox.right();
	for (const auto& frag : fragments) {
		content_left = std::min(content_left, frag.bbox.x);
		content_right = std::max(content_right, frag.bbox.right());
	}
	const double content_width = content_right - content_left;
	if (content_width <= gap) {
		return {};
	}
	std::vector<segment> narrow;
	for (auto& seg : build_segments(bands, fragments, gap)) {
		if (seg.bbox.width <= config.spanning_width_ratio * content_width) {
			narrow.push_back(seg);
		}
	}
	// Only segments with text beside them mark a gutter; a centered title above the columns does not.
	std::vector<segment> eligible;
	for (const auto& seg : narrow) {
		const bool beside = std::ranges::any_of(narrow, [&seg, gap](const segment& other) {
			const bool apart = other.bbox.x - seg.bbox.right() > gap || seg.bbox.x - other.bbox.right() > gap;
			return apart && seg.bbox.vertical_overlap(other.bbox) > 0.0;
		});
		if (beside) {
			eligible.push_back(seg);
		}
	}
	if (eligible.size() < 2 * min_lines) {
		return {};
	}
	const double bin = std::max({config.profile_bin_size, content_width / MAX_PROFILE_BINS, 1e-6});
	const auto bins = static_cast<int>(std::ceil(content_width / bin)) + 1;
	auto to_bin = [&](double x) {
		return std::clamp(static_cast<int>(std::floor((x - content_left) / bin)), 0, bins - 1);
	};
	std::vector<int> delta(static_cast<std::size_t>(bins) + 1, 0);
	for (const auto& seg : eligible) {
		++delta[to_bin(seg.bbox.x)];
		--delta[to_bin(seg.bbox.right()) + 1];
	}
	const auto noise = static_cast<int>(std::floor(config.gap_noise_ratio * static_cast<double>(eligible.size())));
	std::vector<column_boundary> boundaries;
	auto validate = [&](double left_x, double right_x) {
		std::set<std::size_t> left_bands;
		std::set<std::size_t> right_bands;
		double left_top = content_right;
		double left_bottom = 0.0;
		double right_top = content_right;
		double right_bottom = 0.0;
		bool left_seen = false;
		bool right_seen = false;
		for (const auto& seg : eligible) {
			if (seg.bbox.right() <= left_x + bin) {
				left_bands.insert(seg.band_index);
				left_top = left_seen ? std::min(left_top, seg.bbox.y) : seg.bbox.y;
				left_bottom = std::max(left_bottom, seg.bbox.bottom());
				left_seen = true;
			} else if (seg.bbox.x >= right_x - bin) {
				right_bands.insert(seg.band_index);
				right_top = right_seen ? std::min(right_top, seg.bbox.y) : seg.bbox.y;
				right_bottom = std::max(right_bottom, seg.bbox.bottom());
				right_seen = true;
			}
		}
		if (left_bands.size() < min_lines || right_bands.size() < min_lines) {
			return false;
		}
		// Both sides must sit next to each other, not one above the other.
		return std::min(left_bottom, right_bottom) > std::max(left_top, right_top);
	};
	int coverage = 0;
	int run_start = -1;
	for (int i = 0; i < bins; ++i) {
		coverage += delta[static_cast<std::size_t>(i)];
		const bool open = coverage <= noise;
		if (open && run_start < 0) {
			run_start = i;
		} else if (!open && run_start >= 0) {
			const double left_x = content_left + run_start * bin;
			const double right_x = content_left + i * bin;
			if (run_start > 0 && right_x - left_x > gap && validate(left_x, right_x)) {
				boundaries.push_back({left_x, right_x});
			}
			run_start = -1;
		}
	}
	return boundaries;
}

int column_of(const bounding_box& box, const std::vector<column_boundary>& boundaries) {
	int column = 0;
	for (const auto& b : boundaries) {
		if (box.center_x() > b.middle()) {
			++column;
		}
	}
	return column;
}

// True for a box running across a gutter's middle or lying within the gutter.
// A column line that only reaches into the gutter stays in its column.
bool crosses_boundary(const bounding_box& box, const std::vector<column_boundary>& boundaries) {
	return std::ranges::any_of(boundaries, [&box](const column_boundary& b) {
		const bool across = box.x < b.middle() && box.right() > b.middle();
		const bool inside = box.x >= b.left && box.right() <= b.right;
		return across || inside;
	});
}

line_piece make_piece(std::vector<std::size_t> members, std::span<const raw_fragment> fragments, int column) {
	line_piece piece;
	piece.bbox = fragments[members.front()].bbox;
	piece.first_hint = fragments[members.front()].hint_order;
	for (const std::size_t m : members) {
		piece.bbox = piece.bbox.united(fragments[m].bbox);
		piece.first_hint = std::min(piece.first_hint, fragments[m].hint_order);
	}
	piece.members = std::move(members);
	piece.column = column;
	return piece;
}

// Cuts a band at the column boundaries, or keeps it whole when its text runs across one.
void split_band(const band& b, std::span<const raw_fragment> fragments, const std::vector<column_boundary>& boundaries, double gap, std::vector<line_piece>& columns, std::vector<line_piece>& spanning) {
	if (boundaries.empty()) {
		columns.push_back(make_piece(b.members, fragments, 0));
		return;
	}
	bool spans = false;
	double running_right = fragments[b.members.front()].bbox.right();
	int previous_column = column_of(fragments[b.members.front()].bbox, boundaries);
	for (const std::size_t m : b.members) {
		const auto& box = fragments[m].bbox;
		if (crosses_boundary(box, boundaries)) {
			spans = true;
			break;
		}
		const int column = column_of(box, boundaries);
		if (column != previous_column && box.x - running_right <= gap) {
			spans = true;
			break;
		}
		running_right = std::max(running_right, box.right());
		previous_column = column;
	}
	if (spans) {
		spanning.push_back(make_piece(b.members, fragments, -1));
		return;
	}
	std::vector<std::size_t> current;
	int current_column = column_of(fragments[b.members.front()].bbox, boundaries);
	for (const std::size_t m : b.members) {
		const int column = column_of(fragments[m].bbox, boundaries);
		if (column != current_column && !current.empty()) {
			columns.push_back(make_piece(std::move(current), fragments, current_column));
			current.clear();
		}
		current_column = column;
		current.push_back(m);
	}
	columns.push_back(make_piece(std::move(current), fragments, current_column));
}

bool piece_before(const line_piece& a, const line_piece& b) {
	if (a.bbox.center_y() != b.bbox.center_y()) {
		return a.bbox.center_y() < b.bbox.center_y();
	}
	if (a.bbox.x != b.bbox.x) {
		return a.bbox.x < b.bbox.x;
	}
	return a.first_hint < b.first_hint;
}

std::vector<line_piece> order_pieces(std::vector<line_piece> columns, std::vector<line_piece> spanning) {
	std::ranges::sort(spanning, piece_before);
	std::ranges::sort(columns, [](const line_piece& a, const line_piece& b) {
		if (a.column != b.column) {
			return a.column < b.column;
		}
		return piece_before(a, b);
	});
	std::vector<line_piece> ordered;
	ordered.reserve(columns.size() + spanning.size());
	std::vector<bool> emitted(columns.size(), false);
	for (auto& interrupt : spanning) {
		const double cut = interrupt.bbox.center_y();
		for (std::size_t i = 0; i < columns.size(); ++i) {
			if (!emitted[i] && columns[i].bbox.center_y() < cut) {
				ordered.push_back(std::move(columns[i]));
				emitted[i] = true;
			}
		}
		ordered.push_back(std::move(interrupt));
	}
	for (std::size_t i = 0; i < columns.size(); ++i) {
		if (!emitted[i]) {
			ordered.push_back(std::move(columns[i]));
		}
	}
	return ordered;
}

void emit_line(const line_piece& piece, std::span<const raw_fragment> fragments, std::uint32_t page_index, const layout_config& config, resolve_result& result) {
	std::vector<std::size_t> kept;
	kept.reserve(piece.members.size());
	for (const std::size_t idx : piece.members) {
		if (!kept.empty()) {
			const auto& prev = fragments[kept.back()];
			const auto& cur = fragments[idx];
			const double narrower = std::min(prev.bbox.width, cur.bbox.width);
			if (narrower > 0.0 && prev.bbox.horizontal_overlap(cur.bbox) > config.overlap_tolerance * narrower) {
				const bool keep_current = cur.bbox.width > prev.bbox.width;
				const auto& dropped = keep_current ? prev : cur;
				const auto& survivor = keep_current ? cur : prev;
				result.warnings.push_back({.kind = warning_kind::overlapping_word_dropped, .page_index = page_index, .message = "dropped \"" + dropped.text + "\" overlapping \"" + survivor.text + "\""});
				if (keep_current) {
					kept.back() = idx;
				}
				continue;
			}
		}
		kept.push_back(idx);
	}
	reconstructed_line line;
	line.first_word = result.words.size();
	line.word_count = kept.size();
	line.reading_rank = static_cast<int>(result.lines.size());
	line.column = piece.column;
	line.bbox = fragments[kept.front()].bbox;
	for (const std::size_t idx : kept) {
		const auto& frag = fragments[idx];
		line.bbox = line.bbox.united(frag.bbox);
		result.words.push_back({.bbox = frag.bbox, .text = frag.text, .baseline = frag.baseline, .hint_order = frag.hint_order});
	}
	result.lines.push_back(line);
}
} // namespace

resolve_result resolve_fragments(std::span<const raw_fragment> fragments, std::uint32_t page_index, const layout_config& config) {
	resolve_result result;
	if (fragments.empty()) {
		return result;
	}
	if (is_degenerate(fragments)) {
		std::vector<std::size_t> order(fragments.size());
		std::iota(order.begin(), order.end(), std::size_t{0});
		std::ranges::sort(order, [&fragments](std::size_t a, std::size_t b) {
			return fragments[a].hint_order < fragments[b].hint_order;
		});
		result.warnings.push_back({.kind = warning_kind::degenerate_clustering, .page_index = page_index, .message = "all fragments share one position, keeping description order"});
		for (const std::size_t idx : order) {
			emit_line(make_piece({idx}, fragments, 0), fragments, page_index, config, result);
		}
		return result;
	}
	const auto bands = build_bands(fragments, config);
	const double char_width = median_width_of(fragments);
	const double gap = config.column_gap_factor * char_width;
	const auto boundaries = detect_boundaries(fragments, bands, config, char_width);
	std::vector<line_piece> columns;
	std::vector<line_piece> spanning;
	for (const auto& b : bands) {
		split_band(b, fragments, boundaries, gap, columns, spanning);
	}
	for (const auto& piece : order_pieces(std::move(columns), std::move(spanning))) {
		emit_line(piece, fragments, page_index, config, result);
	}
	return result;
}

void resolve_page(page& pg, const layout_config& config) {
	if (pg.resolved) {
		return;
	}
	auto result = resolve_fragments(pg.fragments, pg.index, config);
	pg.words = std::move(result.words);
	pg.lines = std::move(result.lines);
	pg.warnings.insert(pg.warnings.end(), std::make_move_iterator(result.warnings.begin()), std::make_move_iterator(result.warnings.end()));
	pg.fragments.clear();
	pg.fragments.shrink_to_fit();
	pg.resolved = true;
}

void resolve_document(document& doc, const layout_config& config) {
	for (auto& pg : doc.pages) {
		resolve_page(pg, config);
	}
	wxLogVerbose("Resolved %zu pages of %s", doc.page_count(), doc.source_path);
}

std::vector<column_boundary> find_column_boundaries(std::span<const raw_fragment> fragments, const layout_config& config) {
	if (fragments.empty() || is_degenerate(fragments)) {
		return {};
	}
	return detect_boundaries(fragments, build_bands(fragments, config), config, median_width_of(fragments));
}

double median_char_width(std::span<const raw_fragment> fragments) {
	return median_width_of(fragments);
}

double median_char_width(std::span<const word> words) {
	return median_width_of(words);
}

std::string line_text(const page& pg, const reconstructed_line& line, const layout_config& config) {
	return line_text(pg, line, config.space_threshold * median_char_width(std::span<const word>(pg.words)));
}

std::string line_text(const page& pg, const reconstructed_line& line, double space_gap) {
	std::string text;
	double previous_right{0.0};
	bool previous_sized{false};
	bool first = true;
	for (const auto& w : pg.line_words(line)) {
		const bool sized = w.bbox.width > 0.0;
		// Words without geometry cannot be measured, so they are always separated.
		if (!first && (!sized || !previous_sized || w.bbox.x - previous_right > space_gap)) {
			text += ' ';
		}
		text += w.text;
		previous_right = first ? w.bbox.right() : std::max(previous_right, w.bbox.right());
		previous_sized = sized;
		first = false;
	}
	return text;
}
