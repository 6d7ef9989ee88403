/* command_line.cpp - command line parsing.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "command_line.hpp"
#include "constants.hpp"
#include <wx/cmdline.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>
#include <wx/translation.h>

void describe_command_line(wxCmdLineParser& parser) {
	static const wxCmdLineEntryDesc entries[] = {
		{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
		{wxCMD_LINE_SWITCH, "t", "text", "print the text in reading order and exit"},
		{wxCMD_LINE_SWITCH, "d", "dump", "print the mapped grid of one page and exit"},
		{wxCMD_LINE_SWITCH, "x", "xml", "print the layout description and exit"},
		{wxCMD_LINE_OPTION, "p", "page", "page to start on", wxCMD_LINE_VAL_NUMBER},
		{wxCMD_LINE_OPTION, nullptr, "rows", "grid rows for --dump", wxCMD_LINE_VAL_NUMBER},
		{wxCMD_LINE_OPTION, nullptr, "cols", "grid columns for --dump", wxCMD_LINE_VAL_NUMBER},
		{wxCMD_LINE_SWITCH, "v", "verbose", "log details of parsing and layout"},
		{wxCMD_LINE_PARAM, nullptr, nullptr, "PDF or ALTO XML file", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL},
		wxCMD_LINE_DESC_END,
	};
	parser.SetDesc(entries);
	parser.SetLogo(APP_NAME + " " + APP_VERSION);
}

bool read_command_line(const wxCmdLineParser& parser, run_options& options) {
	const int modes = static_cast<int>(parser.Found("t")) + static_cast<int>(parser.Found("d")) + static_cast<int>(parser.Found("x"));
	if (modes > 1) {
		wxLogError(_("Only one of --text, --dump and --xml can be given"));
		return false;
	}
	if (parser.Found("t")) {
		options.mode = run_mode::text;
	} else if (parser.Found("d")) {
		options.mode = run_mode::dump;
	} else if (parser.Found("x")) {
		options.mode = run_mode::xml;
	}
	options.verbose = parser.Found("v");
	long page{1};
	if (parser.Found("p", &page) && page < 1) {
		wxLogError(_("Page numbers start at 1"));
		return false;
	}
	options.start_page = static_cast<int>(page);
	long rows{DEFAULT_DUMP_ROWS};
	long cols{DEFAULT_DUMP_COLS};
	const bool has_rows = parser.Found("rows", &rows);
	const bool has_cols = parser.Found("cols", &cols);
	if (rows < 1 || cols < 1) {
		wxLogError(_("Grid dimensions must be positive"));
		return false;
	}
	if ((has_rows || has_cols) && options.mode != run_mode::dump) {
		wxLogWarning(_("--rows and --cols only apply to --dump"));
	}
	options.dump_rows = static_cast<std::uint32_t>(rows);
	options.dump_cols = static_cast<std::uint32_t>(cols);
	options.dump_rows_given = has_rows;
	options.dump_cols_given = has_cols;
	if (parser.GetParamCount() > 0) {
		options.input_path = parser.GetParam(0);
		if (!wxFileName::FileExists(options.input_path)) {
			wxLogError(_("File not found: %s"), options.input_path);
			return false;
		}
	} else {
		options.input_path = find_sample_file();
		if (options.input_path.IsEmpty()) {
			wxLogError(_("No file given and the bundled %s was not found"), SAMPLE_FILE_NAME);
			return false;
		}
	}
	return true;
}

int exit_code_for(const layout_exception& e) noexcept {
	return e.get_kind() == error_kind::conversion ? EXIT_EXTRACTION_FAILED : EXIT_PARSE_FAILED;
}

wxString find_sample_file() {
	const wxString exe_dir = wxFileName(wxStandardPaths::Get().GetExecutablePath()).GetPath();
	const wxString candidates[] = {
		wxFileName(exe_dir, SAMPLE_FILE_NAME).GetFullPath(),
		wxFileName(wxStandardPaths::Get().GetResourcesDir(), SAMPLE_FILE_NAME).GetFullPath(),
	};
	for (const auto& candidate : candidates) {
		if (wxFileName::FileExists(candidate)) {
			return candidate;
		}
	}
	return {};
}
