/* terminal.hpp - abstract screen interface.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "terminal_grid.hpp"
#include <cstdint>
#include <wx/string.h>

enum class key_command {
	none,
	next_page,
	previous_page,
	first_page,
	last_page,
	scroll_down,
	scroll_up,
	reload,
	toggle_text,
	toggle_xml,
	resize,
	quit
};

// Screen backend the viewer paints on; lets the display loop run without a real terminal.
class terminal {
public:
	terminal() = default;
	virtual ~terminal() = default;
	terminal(const terminal&) = delete;
	terminal& operator=(const terminal&) = delete;
	terminal(terminal&&) = delete;
	terminal& operator=(terminal&&) = delete;
	[[nodiscard]] virtual std::uint32_t rows() const = 0;
	[[nodiscard]] virtual std::uint32_t cols() const = 0;
	// Paints grid rows starting at top_row over the whole screen but the status line.
	virtual void draw_grid(const terminal_grid& grid, std::uint32_t top_row) = 0;
	virtual void draw_status(const wxString& text) = 0;
	virtual void present() = 0;
	// Blocks until the next key and translates it.
	[[nodiscard]] virtual key_command read_command() = 0;
};
