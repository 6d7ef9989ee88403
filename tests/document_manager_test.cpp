/* document_manager_test.cpp - document manager tests.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "document_manager.hpp"
#include "layout_error.hpp"
#include <gtest/gtest.h>
#include <string>
#include <wx/ffile.h>
#include <wx/filefn.h>
#include <wx/filename.h>

namespace {
wxString sample_path() {
	return wxFileName(PAGEGRID_TEST_DATA_DIR, "sample.xml").GetFullPath();
}

class document_manager_test : public ::testing::Test {
protected:
	wxString config_path;
	wxString xml_path;
	config_manager config;

	void SetUp() override {
		config_path = wxFileName::CreateTempFileName("pagegrid_cfg");
		ASSERT_FALSE(config_path.IsEmpty());
		ASSERT_TRUE(config.initialize(config_path));
		const wxString base = wxFileName::CreateTempFileName("pagegrid_doc");
		wxRemoveFile(base);
		xml_path = base + ".xml";
	}

	void TearDown() override {
		config.shutdown();
		wxRemoveFile(config_path);
		if (wxFileName::FileExists(xml_path)) {
			wxRemoveFile(xml_path);
		}
	}

	void write_xml(const std::string& content) {
		wxFFile file(xml_path, "wb");
		ASSERT_TRUE(file.IsOpened());
		ASSERT_TRUE(file.Write(content.data(), content.size()) == content.size());
	}
};
} // namespace

TEST(document_manager, recognizes_layout_descriptions_by_extension) {
	EXPECT_TRUE(is_alto_path("/docs/page.xml"));
	EXPECT_TRUE(is_alto_path("PAGE.XML"));
	EXPECT_FALSE(is_alto_path("/docs/paper.pdf"));
	EXPECT_FALSE(is_alto_path("/docs/xml"));
}

TEST(document_manager, loads_and_resolves_a_description) {
	const auto doc = load_document(sample_path(), layout_config{}, extractor_options{});
	ASSERT_EQ(doc->page_count(), 2u);
	EXPECT_TRUE(doc->fully_resolved());
	EXPECT_FALSE(doc->pages[0].lines.empty());
	EXPECT_NE(load_alto(sample_path(), extractor_options{}).find("<alto"), std::string::npos);
}

TEST_F(document_manager_test, navigates_between_pages) {
	document_manager docs{config, layout_config{}, extractor_options{}};
	EXPECT_FALSE(docs.has_document());
	EXPECT_EQ(docs.get_current_page(), nullptr);
	docs.open_file(sample_path());
	ASSERT_TRUE(docs.has_document());
	EXPECT_EQ(docs.get_page_count(), 2u);
	EXPECT_EQ(docs.get_page_index(), 0u);
	EXPECT_FALSE(docs.go_to_previous_page());
	EXPECT_TRUE(docs.go_to_next_page());
	EXPECT_EQ(docs.get_page_index(), 1u);
	EXPECT_FALSE(docs.go_to_next_page());
	EXPECT_TRUE(docs.go_to_first_page());
	EXPECT_TRUE(docs.go_to_last_page());
	EXPECT_FALSE(docs.go_to_page(5));
	EXPECT_EQ(docs.get_current_page(), &docs.get_document()->pages[1]);
	EXPECT_EQ(docs.get_status_text(), "sample - page 2 of 2");
}

TEST_F(document_manager_test, remembers_the_last_page) {
	{
		document_manager docs{config, layout_config{}, extractor_options{}};
		docs.open_file(sample_path());
		ASSERT_TRUE(docs.go_to_next_page());
	}
	document_manager docs{config, layout_config{}, extractor_options{}};
	docs.open_file(sample_path());
	EXPECT_EQ(docs.get_page_index(), 1u);
}

TEST_F(document_manager_test, keeps_the_open_document_when_loading_fails) {
	document_manager docs{config, layout_config{}, extractor_options{}};
	docs.open_file(sample_path());
	write_xml("<alto><Layout>");
	EXPECT_THROW(docs.open_file(xml_path), layout_exception);
	ASSERT_TRUE(docs.has_document());
	EXPECT_EQ(docs.get_file_path(), sample_path());
}

TEST_F(document_manager_test, reload_picks_up_changes) {
	write_xml(R"(<alto><Layout><Page WIDTH="100" HEIGHT="100"><String CONTENT="before" HPOS="1" VPOS="1" WIDTH="30" HEIGHT="10"/></Page></Layout></alto>)");
	document_manager docs{config, layout_config{}, extractor_options{}};
	docs.open_file(xml_path);
	EXPECT_EQ(docs.get_current_page()->words.front().text, "before");
	write_xml(R"(<alto><Layout><Page WIDTH="100" HEIGHT="100"><String CONTENT="after" HPOS="1" VPOS="1" WIDTH="25" HEIGHT="10"/></Page></Layout></alto>)");
	docs.reload();
	EXPECT_EQ(docs.get_current_page()->words.front().text, "after");
}

TEST_F(document_manager_test, failed_first_load_can_be_retried) {
	write_xml("not xml at all");
	document_manager docs{config, layout_config{}, extractor_options{}};
	try {
		docs.open_file(xml_path);
		FAIL() << "open_file did not throw";
	} catch (const layout_exception& e) {
		EXPECT_EQ(e.get_kind(), error_kind::parse);
		EXPECT_EQ(e.get_error_code(), parse_error_code::malformed_structure);
	}
	EXPECT_FALSE(docs.has_document());
	write_xml(R"(<alto><Layout><Page WIDTH="100" HEIGHT="100"><String CONTENT="fixed" HPOS="1" VPOS="1" WIDTH="25" HEIGHT="10"/></Page></Layout></alto>)");
	docs.reload();
	ASSERT_TRUE(docs.has_document());
	EXPECT_EQ(docs.get_current_page()->words.front().text, "fixed");
}

TEST_F(document_manager_test, missing_files_are_conversion_errors) {
	document_manager docs{config, layout_config{}, extractor_options{}};
	try {
		docs.open_file("/nonexistent/pagegrid/missing.xml");
		FAIL() << "open_file did not throw";
	} catch (const layout_exception& e) {
		EXPECT_EQ(e.get_kind(), error_kind::conversion);
	}
}

TEST_F(document_manager_test, reads_the_description_of_the_open_file) {
	document_manager docs{config, layout_config{}, extractor_options{}};
	EXPECT_THROW(static_cast<void>(docs.read_alto()), layout_exception);
	docs.open_file(sample_path());
	EXPECT_NE(docs.read_alto().find("<alto"), std::string::npos);
}
