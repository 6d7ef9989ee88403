/* config_manager_test.cpp - config manager tests.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>

namespace {
class config_manager_test : public ::testing::Test {
protected:
	wxString path;

	void SetUp() override {
		path = wxFileName::CreateTempFileName("pagegrid_cfg");
		ASSERT_FALSE(path.IsEmpty());
	}

	void TearDown() override {
		wxRemoveFile(path);
	}
};
} // namespace

TEST_F(config_manager_test, writes_defaults_on_first_use) {
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get_path(), path);
	EXPECT_EQ(config.get(config_manager::config_version), 1);
	EXPECT_TRUE(config.get(config_manager::remember_page));
	EXPECT_EQ(config.get(config_manager::extractor_path), "pdfalto");
	EXPECT_TRUE(config.get_config()->HasGroup("/layout"));
	const auto layout = config.load_layout_config();
	EXPECT_DOUBLE_EQ(layout.band_tolerance, 0.5);
	EXPECT_DOUBLE_EQ(layout.cell_aspect_ratio, 2.0);
	EXPECT_EQ(layout.aspect, aspect_mode::preserve);
	EXPECT_EQ(layout.anchor, column_anchor::center);
}

TEST_F(config_manager_test, layout_survives_a_restart) {
	layout_config custom;
	custom.band_tolerance = 0.35;
	custom.column_gap_factor = 2.25;
	custom.min_column_lines = 3;
	custom.cell_aspect_ratio = 2.4;
	custom.max_natural_rows = 400;
	custom.aspect = aspect_mode::fit;
	custom.anchor = column_anchor::left;
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		config.save_layout_config(custom);
		config.set(config_manager::extractor_path, wxString("/opt/pdfalto/pdfalto"));
	}
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	const auto layout = config.load_layout_config();
	EXPECT_DOUBLE_EQ(layout.band_tolerance, 0.35);
	EXPECT_DOUBLE_EQ(layout.column_gap_factor, 2.25);
	EXPECT_EQ(layout.min_column_lines, 3);
	EXPECT_DOUBLE_EQ(layout.cell_aspect_ratio, 2.4);
	EXPECT_EQ(layout.max_natural_rows, 400);
	EXPECT_EQ(layout.aspect, aspect_mode::fit);
	EXPECT_EQ(layout.anchor, column_anchor::left);
	EXPECT_EQ(config.get(config_manager::extractor_path), "/opt/pdfalto/pdfalto");
}

TEST_F(config_manager_test, rejects_non_positive_aspect_ratio) {
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	layout_config broken;
	broken.cell_aspect_ratio = 0.0;
	broken.max_natural_rows = 0;
	config.save_layout_config(broken);
	const auto layout = config.load_layout_config();
	EXPECT_DOUBLE_EQ(layout.cell_aspect_ratio, 2.0);
	EXPECT_EQ(layout.max_natural_rows, layout_config{}.max_natural_rows);
}

TEST_F(config_manager_test, remembers_pages_per_document) {
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_FALSE(config.has_document_history("/docs/a.pdf"));
	EXPECT_EQ(config.get_document_page("/docs/a.pdf"), 0);
	config.set_document_page("/docs/a.pdf", 4);
	config.set_document_page("/docs/b.pdf", 7);
	EXPECT_EQ(config.get_document_page("/docs/a.pdf"), 4);
	EXPECT_EQ(config.get_document_page("/docs/b.pdf"), 7);
	EXPECT_TRUE(config.has_document_history("/docs/a.pdf"));
	config.remove_document_history("/docs/a.pdf");
	EXPECT_FALSE(config.has_document_history("/docs/a.pdf"));
	EXPECT_EQ(config.get_document_page("/docs/b.pdf"), 7);
}

TEST(config_manager, document_sections_are_stable_digests) {
	const wxString section = config_manager::get_document_section("/docs/a.pdf");
	EXPECT_TRUE(section.StartsWith("/doc_"));
	EXPECT_EQ(section.length(), 45u);
	EXPECT_EQ(section.Find('/', true), 0);
	EXPECT_EQ(section, config_manager::get_document_section("/docs/a.pdf"));
	EXPECT_NE(section, config_manager::get_document_section("/docs/b.pdf"));
}
