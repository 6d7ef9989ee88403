/* command_line.hpp - command line parsing header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "layout_error.hpp"
#include <cstdint>
#include <wx/cmdline.h>
#include <wx/string.h>

enum class run_mode {
	view,
	text,
	dump,
	xml
};

struct run_options {
	run_mode mode{run_mode::view};
	wxString input_path;
	// 1-based.
	int start_page{1};
	std::uint32_t dump_rows{0};
	std::uint32_t dump_cols{0};
	// False when the size came from the built-in defaults.
	bool dump_rows_given{false};
	bool dump_cols_given{false};
	bool verbose{false};
};

void describe_command_line(wxCmdLineParser& parser);
// Fills options from a successfully parsed command line. Logs an error and returns false on an invalid value.
[[nodiscard]] bool read_command_line(const wxCmdLineParser& parser, run_options& options);
[[nodiscard]] int exit_code_for(const layout_exception& e) noexcept;
// Bundled sample description shown when no file is given; empty when it cannot be found.
[[nodiscard]] wxString find_sample_file();
