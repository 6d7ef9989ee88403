/* document_manager.cpp - document loading and page navigation.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document_manager.hpp"
#include "alto_parser.hpp"
#include "layout_error.hpp"
#include "reading_order.hpp"
#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

bool is_alto_path(const wxString& path) {
	return wxFileName(path).GetExt().IsSameAs("xml", false);
}

std::string load_alto(const wxString& path, const extractor_options& options) {
	if (!is_alto_path(path)) {
		return extract_alto(path, options);
	}
	return read_alto_file(path);
}

std::unique_ptr<document> load_document(const wxString& path, const layout_config& layout, const extractor_options& options) {
	std::unique_ptr<document> doc;
	if (is_alto_path(path)) {
		doc = parse_alto_file(path);
	} else {
		doc = parse_alto(extract_alto(path, options), path);
	}
	resolve_document(*doc, layout);
	return doc;
}

document_manager::document_manager(config_manager& cfg, const layout_config& layout, extractor_options options) : config{cfg}, layout{layout}, options{std::move(options)} {
}

document_manager::~document_manager() {
	save_document_position();
}

void document_manager::open_file(const wxString& path) {
	const wxString full_path = wxFileName(path).GetAbsolutePath();
	std::unique_ptr<document> loaded;
	try {
		loaded = load_document(full_path, layout, options);
	} catch (const layout_exception&) {
		// A failed first load still remembers its path for reload.
		if (!doc) {
			file_path = full_path;
		}
		throw;
	}
	save_document_position();
	doc = std::move(loaded);
	file_path = full_path;
	page_index = 0;
	restore_document_position();
	wxLogMessage(_("Opened %s (%zu pages)"), file_path, doc->page_count());
}

void document_manager::reload() {
	if (file_path.IsEmpty()) {
		return;
	}
	const std::size_t keep = page_index;
	doc = load_document(file_path, layout, options);
	page_index = std::min(keep, doc->page_count() == 0 ? 0 : doc->page_count() - 1);
	wxLogVerbose("Reloaded %s", file_path);
}

void document_manager::close_document() {
	save_document_position();
	doc.reset();
	file_path.clear();
	page_index = 0;
}

std::string document_manager::read_alto() const {
	if (file_path.IsEmpty()) {
		throw layout_exception(_("No document is open"), error_kind::conversion);
	}
	return load_alto(file_path, options);
}

const page* document_manager::get_current_page() const noexcept {
	if (!doc || page_index >= doc->pages.size()) {
		return nullptr;
	}
	return &doc->pages[page_index];
}

std::size_t document_manager::get_page_count() const noexcept {
	return doc ? doc->page_count() : 0;
}

bool document_manager::go_to_page(std::size_t index) {
	if (!doc || index >= doc->page_count() || index == page_index) {
		return false;
	}
	page_index = index;
	return true;
}

bool document_manager::go_to_next_page() {
	return go_to_page(page_index + 1);
}

bool document_manager::go_to_previous_page() {
	if (page_index == 0) {
		return false;
	}
	return go_to_page(page_index - 1);
}

bool document_manager::go_to_first_page() {
	return go_to_page(0);
}

bool document_manager::go_to_last_page() {
	if (get_page_count() == 0) {
		return false;
	}
	return go_to_page(get_page_count() - 1);
}

void document_manager::save_document_position() const {
	if (!doc || file_path.IsEmpty() || !config.get(config_manager::remember_page)) {
		return;
	}
	config.set_document_page(file_path, static_cast<int>(page_index));
	config.flush();
}

wxString document_manager::get_status_text() const {
	if (!doc) {
		return _("No document");
	}
	return wxString::Format(_("%s - page %zu of %zu"), doc->title, page_index + 1, doc->page_count());
}

void document_manager::restore_document_position() {
	if (!config.get(config_manager::remember_page)) {
		return;
	}
	const int saved = config.get_document_page(file_path);
	if (saved > 0 && static_cast<std::size_t>(saved) < doc->page_count()) {
		page_index = static_cast<std::size_t>(saved);
	}
}
