/* curses_terminal.cpp - ncurses screen backend.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "curses_terminal.hpp"
#include "layout_error.hpp"
#include <algorithm>
#include <clocale>
#include <cstdint>
#include <curses.h>
#include <string>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
constexpr int ESCAPE_KEY = 27;

int screen_rows() {
	return std::max(0, getmaxy(stdscr));
}

int screen_cols() {
	return std::max(0, getmaxx(stdscr));
}

// Terminal rows left for the page once the status line is drawn.
int page_rows() {
	return std::max(0, screen_rows() - 1);
}
} // namespace

curses_terminal::curses_terminal() {
	std::setlocale(LC_ALL, "");
	if (initscr() == nullptr) {
		throw layout_exception(_("Failed to initialize the terminal"), error_kind::conversion);
	}
	cbreak();
	noecho();
	keypad(stdscr, TRUE);
	curs_set(0);
}

curses_terminal::~curses_terminal() {
	endwin();
}

std::uint32_t curses_terminal::rows() const {
	return static_cast<std::uint32_t>(page_rows());
}

std::uint32_t curses_terminal::cols() const {
	return static_cast<std::uint32_t>(screen_cols());
}

void curses_terminal::draw_grid(const terminal_grid& grid, std::uint32_t top_row) {
	const int visible = page_rows();
	const int width = std::min(screen_cols(), static_cast<int>(grid.cols()));
	for (int y = 0; y < visible; ++y) {
		move(y, 0);
		clrtoeol();
		const std::uint32_t row = top_row + static_cast<std::uint32_t>(y);
		if (row >= grid.rows() || width <= 0) {
			continue;
		}
		const auto chars = grid.row_chars(row);
		const std::wstring line(chars.begin(), chars.begin() + width);
		mvaddnwstr(y, 0, line.c_str(), width);
	}
}

void curses_terminal::draw_status(const wxString& text) {
	const int y = screen_rows() - 1;
	if (y < 0) {
		return;
	}
	move(y, 0);
	clrtoeol();
	attron(A_REVERSE);
	const std::wstring status = text.ToStdWstring();
	mvaddnwstr(y, 0, status.c_str(), std::min(static_cast<int>(status.size()), screen_cols()));
	attroff(A_REVERSE);
}

void curses_terminal::present() {
	::refresh();
}

key_command curses_terminal::read_command() {
	return translate_key(getch());
}

key_command translate_key(int key) noexcept {
	switch (key) {
		case 'n':
		case ' ':
		case KEY_RIGHT:
		case KEY_NPAGE:
			return key_command::next_page;
		case 'p':
		case 'b':
		case KEY_LEFT:
		case KEY_PPAGE:
			return key_command::previous_page;
		case 'g':
		case KEY_HOME:
			return key_command::first_page;
		case 'G':
		case KEY_END:
			return key_command::last_page;
		case 'j':
		case KEY_DOWN:
			return key_command::scroll_down;
		case 'k':
		case KEY_UP:
			return key_command::scroll_up;
		case 'r':
			return key_command::reload;
		case 't':
			return key_command::toggle_text;
		case 'x':
			return key_command::toggle_xml;
		case KEY_RESIZE:
			return key_command::resize;
		case 'q':
		case 'Q':
		case ESCAPE_KEY:
			return key_command::quit;
		default:
			return key_command::none;
	}
}
