/* viewer.cpp - interactive page viewer.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "viewer.hpp"
#include "alto_parser.hpp"
#include "grid_mapper.hpp"
#include "layout_error.hpp"
#include "text_export.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
// Cap for the text and XML views, whose length does not depend on the page geometry.
constexpr std::uint32_t MAX_TEXT_ROWS = 10000;
} // namespace

viewer::viewer(terminal& term, document_manager& docs) : term{term}, docs{docs} {
}

void viewer::run() {
	render();
	while (handle_command(term.read_command())) {
		render();
	}
	docs.save_document_position();
}

bool viewer::handle_command(key_command command) {
	switch (command) {
		case key_command::quit:
			return false;
		case key_command::next_page:
			navigated(docs.go_to_next_page());
			break;
		case key_command::previous_page:
			navigated(docs.go_to_previous_page());
			break;
		case key_command::first_page:
			navigated(docs.go_to_first_page());
			break;
		case key_command::last_page:
			navigated(docs.go_to_last_page());
			break;
		case key_command::scroll_down:
			top_row = std::min(top_row + 1, max_top_row());
			break;
		case key_command::scroll_up:
			top_row = top_row > 0 ? top_row - 1 : 0;
			break;
		case key_command::reload:
			try {
				docs.reload();
				xml_text.clear();
				if (mode == view_mode::xml) {
					load_xml();
				}
				error.clear();
				top_row = 0;
			} catch (const layout_exception& e) {
				wxLogError("%s", e.get_display_message());
				show_error(e.get_display_message());
				if (mode == view_mode::xml && xml_text.empty()) {
					mode = view_mode::layout;
				}
			}
			break;
		case key_command::toggle_text:
			toggle_mode(view_mode::text);
			break;
		case key_command::toggle_xml:
			toggle_mode(view_mode::xml);
			break;
		case key_command::resize:
		case key_command::none:
			break;
	}
	return true;
}

void viewer::render() {
	rebuild_grid();
	term.draw_grid(grid, top_row);
	term.draw_status(get_status_text());
	term.present();
}

void viewer::show_error(const wxString& message) {
	error = message;
	top_row = 0;
}

wxString viewer::get_status_text() const {
	wxString status = has_error() ? wxString(_("Error")) : docs.get_status_text();
	if (!has_error() && mode == view_mode::text) {
		status += _(" [text]");
	} else if (!has_error() && mode == view_mode::xml) {
		status += _(" [xml]");
	}
	if (warning_count > 0) {
		status += wxString::Format("  !%zu", warning_count);
	}
	return status;
}

void viewer::rebuild_grid() {
	const std::uint32_t rows = term.rows();
	const std::uint32_t cols = term.cols();
	warning_count = 0;
	const page* pg = docs.get_current_page();
	if (has_error() || pg == nullptr) {
		const wxString text = has_error() ? error : wxString(_("No document"));
		grid = message_grid(rows, cols, std::string(text.utf8_str()));
		top_row = 0;
		return;
	}
	const auto& layout = docs.get_layout();
	if (mode != view_mode::layout) {
		const std::string text = mode == view_mode::text ? page_text(*pg, layout) : xml_text;
		grid = text_grid(text, rows, cols, MAX_TEXT_ROWS);
		warning_count = pg->warnings.size();
		top_row = std::min(top_row, max_top_row());
		return;
	}
	const std::uint32_t mapped_rows = std::max(rows, natural_rows(*pg, cols, layout));
	auto result = map_page(*pg, mapped_rows, cols, layout);
	grid = std::move(result.grid);
	warning_count = pg->warnings.size() + result.warnings.size();
	top_row = std::min(top_row, max_top_row());
}

std::uint32_t viewer::max_top_row() const {
	const std::uint32_t visible = term.rows();
	return grid.rows() > visible ? grid.rows() - visible : 0;
}

void viewer::navigated(bool moved) {
	if (moved || (has_error() && docs.has_document())) {
		error.clear();
		top_row = 0;
	}
}

void viewer::toggle_mode(view_mode target) {
	if (!docs.has_document()) {
		return;
	}
	top_row = 0;
	if (mode == target) {
		mode = view_mode::layout;
		return;
	}
	if (target == view_mode::xml && xml_text.empty()) {
		try {
			load_xml();
		} catch (const layout_exception& e) {
			wxLogError("%s", e.get_display_message());
			show_error(e.get_display_message());
			return;
		}
	}
	mode = target;
}

void viewer::load_xml() {
	xml_text = format_alto(docs.read_alto());
}
