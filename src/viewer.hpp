/* viewer.hpp - interactive page viewer header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document_manager.hpp"
#include "terminal.hpp"
#include "terminal_grid.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <wx/string.h>

enum class view_mode {
	// Words placed where they sit on the page.
	layout,
	// Reading-order text of the current page.
	text,
	// Pretty-printed ALTO description of the whole document.
	xml
};

// Display loop: maps the current page onto the terminal and reacts to key commands.
class viewer {
public:
	viewer(terminal& term, document_manager& docs);
	~viewer() = default;
	viewer(const viewer&) = delete;
	viewer& operator=(const viewer&) = delete;
	viewer(viewer&&) = delete;
	viewer& operator=(viewer&&) = delete;
	void run();
	// Returns false once the user asked to quit.
	bool handle_command(key_command command);
	void render();
	// Replaces the page with a diagnostic until the next successful load or navigation.
	void show_error(const wxString& message);

	[[nodiscard]] const terminal_grid& get_grid() const noexcept {
		return grid;
	}

	[[nodiscard]] std::uint32_t get_top_row() const noexcept {
		return top_row;
	}

	[[nodiscard]] view_mode get_mode() const noexcept {
		return mode;
	}

	[[nodiscard]] bool has_error() const noexcept {
		return !error.IsEmpty();
	}

	[[nodiscard]] wxString get_status_text() const;

private:
	terminal& term;
	document_manager& docs;
	terminal_grid grid;
	std::uint32_t top_row{0};
	std::size_t warning_count{0};
	wxString error;
	view_mode mode{view_mode::layout};
	std::string xml_text;

	void rebuild_grid();
	[[nodiscard]] std::uint32_t max_top_row() const;
	void navigated(bool moved);
	void toggle_mode(view_mode target);
	void load_xml();
};
