/* curses_terminal.hpp - ncurses screen backend header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "terminal.hpp"
#include <cstdint>
#include <wx/string.h>

// ncurses screen on stdin/stdout. Only one may exist at a time.
class curses_terminal : public terminal {
public:
	curses_terminal();
	~curses_terminal() override;
	[[nodiscard]] std::uint32_t rows() const override;
	[[nodiscard]] std::uint32_t cols() const override;
	void draw_grid(const terminal_grid& grid, std::uint32_t top_row) override;
	void draw_status(const wxString& text) override;
	void present() override;
	[[nodiscard]] key_command read_command() override;
};

[[nodiscard]] key_command translate_key(int key) noexcept;
