/* text_export_test.cpp - text export tests.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "reading_order.hpp"
#include "test_helpers.hpp"
#include "text_export.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace {
page resolved_page(std::vector<raw_fragment> fragments) {
	auto pg = make_page(200, 300, std::move(fragments));
	resolve_page(pg, layout_config{});
	return pg;
}
} // namespace

TEST(text_export, separates_paragraphs_with_blank_lines) {
	const auto pg = resolved_page({
		make_fragment("First", 10, 10, 25, 10),
		make_fragment("line", 40, 10, 20, 10),
		make_fragment("second", 10, 22, 30, 10),
		make_fragment("Third", 10, 60, 25, 10),
	});
	EXPECT_EQ(page_text(pg, layout_config{}), "First line\nsecond\n\n\nThird\n");
}

TEST(text_export, caps_blank_lines) {
	const auto pg = resolved_page({make_fragment("top", 10, 10, 15, 10), make_fragment("end", 10, 250, 15, 10)});
	EXPECT_EQ(page_text(pg, layout_config{}), "top\n\n\n\nend\n");
	layout_config single;
	single.max_blank_lines = 1;
	EXPECT_EQ(page_text(pg, single), "top\n\nend\n");
}

TEST(text_export, empty_page_has_no_text) {
	const auto pg = resolved_page({});
	EXPECT_EQ(page_text(pg, layout_config{}), "");
}

TEST(text_export, separates_pages_with_form_feeds) {
	document doc;
	doc.pages.push_back(resolved_page({make_fragment("one", 10, 10, 15, 10)}));
	doc.pages.push_back(resolved_page({make_fragment("two", 10, 10, 15, 10)}));
	EXPECT_EQ(document_text(doc, layout_config{}), "one\n\ftwo\n");
}

TEST(text_export, follows_reading_order_across_columns) {
	const auto pg = resolved_page({
		make_fragment("Right-Top", 100, 10, 40, 10),
		make_fragment("Left-Top", 10, 10, 40, 10),
		make_fragment("Right-Bottom", 100, 22, 40, 10),
		make_fragment("Left-Bottom", 10, 22, 40, 10),
	});
	EXPECT_EQ(page_text(pg, layout_config{}), "Left-Top\nLeft-Bottom\nRight-Top\nRight-Bottom\n");
}
