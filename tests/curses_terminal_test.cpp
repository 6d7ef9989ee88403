/* curses_terminal_test.cpp - key translation tests.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "curses_terminal.hpp"
#include <curses.h>
#include <gtest/gtest.h>

TEST(curses_terminal, translates_paging_keys) {
	EXPECT_EQ(translate_key('n'), key_command::next_page);
	EXPECT_EQ(translate_key(' '), key_command::next_page);
	EXPECT_EQ(translate_key(KEY_NPAGE), key_command::next_page);
	EXPECT_EQ(translate_key('b'), key_command::previous_page);
	EXPECT_EQ(translate_key(KEY_LEFT), key_command::previous_page);
	EXPECT_EQ(translate_key('g'), key_command::first_page);
	EXPECT_EQ(translate_key('G'), key_command::last_page);
	EXPECT_EQ(translate_key(KEY_END), key_command::last_page);
}

TEST(curses_terminal, translates_scroll_and_control_keys) {
	EXPECT_EQ(translate_key('j'), key_command::scroll_down);
	EXPECT_EQ(translate_key(KEY_UP), key_command::scroll_up);
	EXPECT_EQ(translate_key('r'), key_command::reload);
	EXPECT_EQ(translate_key(KEY_RESIZE), key_command::resize);
	EXPECT_EQ(translate_key('q'), key_command::quit);
	EXPECT_EQ(translate_key(27), key_command::quit);
	EXPECT_EQ(translate_key('z'), key_command::none);
	EXPECT_EQ(translate_key(ERR), key_command::none);
}

TEST(curses_terminal, translates_view_toggles) {
	EXPECT_EQ(translate_key('t'), key_command::toggle_text);
	EXPECT_EQ(translate_key('x'), key_command::toggle_xml);
}
