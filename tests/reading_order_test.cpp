/* reading_order_test.cpp - reading order resolver tests.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "reading_order.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cstddef>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
std::vector<std::string> resolved_texts(std::vector<raw_fragment> fragments, double width = 200.0, double height = 100.0) {
	auto pg = make_page(width, height, std::move(fragments));
	resolve_page(pg, layout_config{});
	return line_texts(pg);
}

std::vector<raw_fragment> two_columns() {
	return {
		make_fragment("Left-Top", 10, 10, 40, 10),
		make_fragment("Left-Bottom", 10, 30, 40, 10),
		make_fragment("Right-Top", 100, 10, 40, 10),
		make_fragment("Right-Bottom", 100, 30, 40, 10),
	};
}

// Rank of the line holding the word with the given hint order.
int rank_of(const page& pg, std::size_t hint) {
	for (const auto& line : pg.lines) {
		for (const auto& w : pg.line_words(line)) {
			if (w.hint_order == hint) {
				return line.reading_rank;
			}
		}
	}
	return -1;
}

bool has_warning(const resolve_result& result, warning_kind kind) {
	return std::ranges::any_of(result.warnings, [kind](const layout_warning& w) {
		return w.kind == kind;
	});
}
} // namespace

TEST(reading_order, reads_two_columns_left_then_right) {
	const std::vector<std::string> expected{"Left-Top", "Left-Bottom", "Right-Top", "Right-Bottom"};
	EXPECT_EQ(resolved_texts(two_columns(), 200, 50), expected);
}

TEST(reading_order, ignores_description_order_of_columns) {
	auto fragments = two_columns();
	std::ranges::reverse(fragments);
	const std::vector<std::string> expected{"Left-Top", "Left-Bottom", "Right-Top", "Right-Bottom"};
	EXPECT_EQ(resolved_texts(fragments, 200, 50), expected);
}

TEST(reading_order, detects_the_gap_between_two_columns) {
	const auto fragments = two_columns();
	const auto boundaries = find_column_boundaries(fragments, layout_config{});
	ASSERT_EQ(boundaries.size(), 1u);
	EXPECT_GE(boundaries[0].left, 50.0);
	EXPECT_LE(boundaries[0].right, 100.0);
}

TEST(reading_order, emits_full_width_heading_before_columns) {
	auto fragments = two_columns();
	fragments.push_back(make_fragment("Heading", 10, 0, 180, 8));
	const std::vector<std::string> expected{"Heading", "Left-Top", "Left-Bottom", "Right-Top", "Right-Bottom"};
	EXPECT_EQ(resolved_texts(fragments, 200, 50), expected);
}

TEST(reading_order, narrow_centered_heading_keeps_columns) {
	auto fragments = two_columns();
	fragments.push_back(make_fragment("Title", 40, 0, 70, 8));
	const auto boundaries = find_column_boundaries(fragments, layout_config{});
	ASSERT_EQ(boundaries.size(), 1u);
	EXPECT_GE(boundaries[0].left, 50.0);
	EXPECT_LE(boundaries[0].right, 100.0);
	auto pg = make_page(200, 50, fragments);
	resolve_page(pg, layout_config{});
	const std::vector<std::string> expected{"Title", "Left-Top", "Left-Bottom", "Right-Top", "Right-Bottom"};
	EXPECT_EQ(line_texts(pg), expected);
	EXPECT_EQ(pg.lines[0].column, -1);
}

TEST(reading_order, centered_title_and_author_span_the_gutter) {
	std::vector<raw_fragment> fragments{
		make_fragment("Title", 60, 0, 80, 10),
		make_fragment("Author", 70, 14, 60, 10),
	};
	const char* left[] = {"left0", "left1", "left2", "left3"};
	const char* right[] = {"righ0", "righ1", "righ2", "righ3"};
	for (int i = 0; i < 4; ++i) {
		fragments.push_back(make_fragment(left[i], 10, 30 + i * 14, 40, 10));
		fragments.push_back(make_fragment(right[i], 110, 30 + i * 14, 40, 10));
	}
	const auto boundaries = find_column_boundaries(fragments, layout_config{});
	ASSERT_EQ(boundaries.size(), 1u);
	EXPECT_GE(boundaries[0].left, 50.0);
	EXPECT_LE(boundaries[0].left, 52.0);
	EXPECT_GE(boundaries[0].right, 109.0);
	EXPECT_LE(boundaries[0].right, 110.0);
	auto pg = make_page(200, 100, fragments);
	resolve_page(pg, layout_config{});
	const std::vector<std::string> expected{"Title", "Author", "left0", "left1", "left2", "left3", "righ0", "righ1", "righ2", "righ3"};
	EXPECT_EQ(line_texts(pg), expected);
	EXPECT_EQ(pg.lines[1].column, -1);
	EXPECT_EQ(pg.lines[2].column, 0);
	EXPECT_EQ(pg.lines[6].column, 1);
}

TEST(reading_order, full_width_band_interrupts_column_order) {
	const std::vector<raw_fragment> fragments{
		make_fragment("LeftOne.", 10, 10, 40, 10),
		make_fragment("LeftTwo.", 10, 25, 40, 10),
		make_fragment("RightOne", 100, 10, 40, 10),
		make_fragment("RightTwo", 100, 25, 40, 10),
		make_fragment("A full width line in between", 10, 45, 180, 10),
		make_fragment("LeftThre", 10, 65, 40, 10),
		make_fragment("LeftFour", 10, 80, 40, 10),
		make_fragment("RightThr", 100, 65, 40, 10),
		make_fragment("RightFou", 100, 80, 40, 10),
	};
	auto pg = make_page(200, 100, fragments);
	resolve_page(pg, layout_config{});
	const std::vector<std::string> expected{"LeftOne.", "LeftTwo.", "RightOne", "RightTwo", "A full width line in between", "LeftThre", "LeftFour", "RightThr", "RightFou"};
	EXPECT_EQ(line_texts(pg), expected);
	EXPECT_EQ(pg.lines[4].column, -1);
	EXPECT_EQ(pg.lines[0].column, 0);
	EXPECT_EQ(pg.lines[2].column, 1);
}

TEST(reading_order, single_column_ranks_follow_position) {
	std::vector<raw_fragment> fragments;
	const char* words[] = {"alpha", "bravo", "delta"};
	for (int row = 0; row < 6; ++row) {
		for (int col = 0; col < 3; ++col) {
			fragments.push_back(make_fragment(words[col], 10 + col * 30, 10 + row * 14, 25, 10));
		}
	}
	std::ranges::reverse(fragments);
	auto pg = make_page(120, 100, fragments);
	const auto original = pg.fragments;
	resolve_page(pg, layout_config{});
	ASSERT_EQ(pg.lines.size(), 6u);
	for (const auto& a : original) {
		for (const auto& b : original) {
			const bool above = a.bbox.center_y() < b.bbox.center_y();
			const bool left_or_same = a.bbox.x <= b.bbox.x;
			if (above && left_or_same) {
				EXPECT_LT(rank_of(pg, a.hint_order), rank_of(pg, b.hint_order));
			}
		}
	}
	for (std::size_t i = 1; i < pg.lines.size(); ++i) {
		EXPECT_GT(pg.lines[i].reading_rank, pg.lines[i - 1].reading_rank);
	}
}

TEST(reading_order, joins_words_with_jittered_baselines) {
	const std::vector<std::string> expected{"one two three", "next"};
	EXPECT_EQ(resolved_texts({
				  make_fragment("one", 10, 10, 15, 10),
				  make_fragment("two", 30, 11.5, 15, 10),
				  make_fragment("three", 50, 9, 25, 10),
				  make_fragment("next", 10, 30, 20, 10),
			  }),
		expected);
}

TEST(reading_order, orders_words_left_to_right) {
	auto pg = make_page(200, 50, {make_fragment("c", 50, 10, 5, 10), make_fragment("a", 10, 10, 5, 10), make_fragment("b", 30, 10, 5, 10)});
	resolve_page(pg, layout_config{});
	ASSERT_EQ(pg.lines.size(), 1u);
	const auto words = pg.line_words(pg.lines[0]);
	ASSERT_EQ(words.size(), 3u);
	EXPECT_EQ(words[0].text, "a");
	EXPECT_EQ(words[1].text, "b");
	EXPECT_EQ(words[2].text, "c");
	EXPECT_DOUBLE_EQ(pg.lines[0].bbox.x, 10.0);
	EXPECT_DOUBLE_EQ(pg.lines[0].bbox.right(), 55.0);
}

TEST(reading_order, empty_page_resolves_to_no_lines) {
	const auto result = resolve_fragments({}, 0, layout_config{});
	EXPECT_TRUE(result.lines.empty());
	EXPECT_TRUE(result.words.empty());
	EXPECT_TRUE(result.warnings.empty());
}

TEST(reading_order, resolving_twice_gives_identical_lines) {
	auto fragments = two_columns();
	fragments.push_back(make_fragment("Heading", 10, 0, 180, 8));
	const auto first = resolve_fragments(fragments, 0, layout_config{});
	const auto second = resolve_fragments(fragments, 0, layout_config{});
	ASSERT_EQ(first.lines.size(), second.lines.size());
	ASSERT_EQ(first.words.size(), second.words.size());
	for (std::size_t i = 0; i < first.lines.size(); ++i) {
		EXPECT_EQ(first.lines[i].reading_rank, second.lines[i].reading_rank);
		EXPECT_EQ(first.lines[i].bbox, second.lines[i].bbox);
		EXPECT_EQ(first.lines[i].first_word, second.lines[i].first_word);
		EXPECT_EQ(first.lines[i].word_count, second.lines[i].word_count);
	}
	for (std::size_t i = 0; i < first.words.size(); ++i) {
		EXPECT_EQ(first.words[i].text, second.words[i].text);
		EXPECT_EQ(first.words[i].bbox, second.words[i].bbox);
	}
}

TEST(reading_order, falls_back_to_description_order_when_degenerate) {
	const std::vector<raw_fragment> fragments{
		make_fragment("first", 5, 5, 10, 10, 0),
		make_fragment("second", 5, 5, 10, 10, 1),
		make_fragment("third", 5, 5, 10, 10, 2),
	};
	const auto result = resolve_fragments(fragments, 3, layout_config{});
	ASSERT_EQ(result.lines.size(), 3u);
	EXPECT_EQ(result.words[0].text, "first");
	EXPECT_EQ(result.words[1].text, "second");
	EXPECT_EQ(result.words[2].text, "third");
	ASSERT_TRUE(has_warning(result, warning_kind::degenerate_clustering));
	EXPECT_EQ(result.warnings.front().page_index, 3u);
}

TEST(reading_order, drops_the_narrower_of_overlapping_words) {
	const auto kept_first = resolve_fragments(std::vector<raw_fragment>{make_fragment("Hello", 10, 10, 50, 10, 0), make_fragment("Hell", 12, 10, 40, 10, 1)}, 0, layout_config{});
	ASSERT_EQ(kept_first.words.size(), 1u);
	EXPECT_EQ(kept_first.words[0].text, "Hello");
	EXPECT_TRUE(has_warning(kept_first, warning_kind::overlapping_word_dropped));
	const auto kept_second = resolve_fragments(std::vector<raw_fragment>{make_fragment("Hel", 10, 10, 30, 10, 0), make_fragment("Hello", 12, 10, 50, 10, 1)}, 0, layout_config{});
	ASSERT_EQ(kept_second.words.size(), 1u);
	EXPECT_EQ(kept_second.words[0].text, "Hello");
	ASSERT_EQ(kept_second.lines.size(), 1u);
	EXPECT_EQ(kept_second.lines[0].word_count, 1u);
}

TEST(reading_order, keeps_words_that_only_touch) {
	const auto result = resolve_fragments(std::vector<raw_fragment>{make_fragment("foo", 10, 10, 15, 10, 0), make_fragment("bar", 25, 10, 15, 10, 1)}, 0, layout_config{});
	EXPECT_EQ(result.words.size(), 2u);
	EXPECT_TRUE(result.warnings.empty());
}

TEST(reading_order, resolve_page_releases_fragments) {
	auto pg = make_page(200, 50, two_columns());
	resolve_page(pg, layout_config{});
	EXPECT_TRUE(pg.resolved);
	EXPECT_TRUE(pg.fragments.empty());
	EXPECT_EQ(pg.lines.size(), 4u);
	EXPECT_EQ(pg.words.size(), 4u);
	resolve_page(pg, layout_config{});
	EXPECT_EQ(pg.lines.size(), 4u);
}

TEST(reading_order, line_text_spaces_only_real_gaps) {
	auto pg = make_page(200, 50, {make_fragment("foo", 10, 10, 15, 10), make_fragment("bar", 25, 10, 15, 10), make_fragment("baz", 50, 10, 15, 10)});
	resolve_page(pg, layout_config{});
	ASSERT_EQ(pg.lines.size(), 1u);
	EXPECT_EQ(line_text(pg, pg.lines[0], layout_config{}), "foobar baz");
	EXPECT_EQ(line_text(pg, pg.lines[0], 0.0), "foobar baz");
	EXPECT_EQ(line_text(pg, pg.lines[0], 20.0), "foobarbaz");
}

TEST(reading_order, median_char_width_ignores_unsized_fragments) {
	const std::vector<raw_fragment> fragments{make_fragment("abcd", 0, 0, 8, 10), make_fragment("ab", 0, 0, 6, 10), make_fragment("xyz", 0, 0, 0, 10)};
	EXPECT_DOUBLE_EQ(median_char_width(fragments), 2.5);
	EXPECT_DOUBLE_EQ(median_char_width(std::vector<raw_fragment>{}), 0.0);
}

TEST(reading_order, config_controls_band_tolerance) {
	const std::vector<raw_fragment> fragments{make_fragment("upper", 10, 10, 25, 10), make_fragment("lower", 40, 14, 25, 10)};
	EXPECT_EQ(resolve_fragments(fragments, 0, layout_config{}).lines.size(), 1u);
	layout_config strict;
	strict.band_tolerance = 0.2;
	EXPECT_EQ(resolve_fragments(fragments, 0, strict).lines.size(), 2u);
}
