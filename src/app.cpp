/* app.cpp - wxAppConsole implementation code.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "alto_parser.hpp"
#include "constants.hpp"
#include "curses_terminal.hpp"
#include "document_manager.hpp"
#include "grid_mapper.hpp"
#include "layout_error.hpp"
#include "text_export.hpp"
#include "utils.hpp"
#include "viewer.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <wx/cmdline.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/translation.h>

namespace {
void write_stdout(const std::string& text) {
	std::fwrite(text.data(), 1, text.size(), stdout);
	std::fflush(stdout);
}
} // namespace

bool app::OnInit() {
	SetAppName(APP_NAME);
	wxLog::DisableTimestamp();
	wxCmdLineParser parser(argc, argv);
	describe_command_line(parser);
	switch (parser.Parse(true)) {
		case -1:
			finished = true;
			exit_status = EXIT_OK;
			return true;
		case 0:
			break;
		default:
			finished = true;
			exit_status = EXIT_BAD_USAGE;
			return true;
	}
	if (!read_command_line(parser, options)) {
		finished = true;
		exit_status = EXIT_BAD_USAGE;
		return true;
	}
	if (!config_mgr.initialize()) {
		wxLogWarning(_("Failed to initialize configuration, using defaults"));
	}
	layout = config_mgr.load_layout_config();
	extraction.executable = config_mgr.get(config_manager::extractor_path);
	const int saved_rows = config_mgr.get(config_manager::dump_rows);
	const int saved_cols = config_mgr.get(config_manager::dump_cols);
	if (!options.dump_rows_given && saved_rows > 0) {
		options.dump_rows = static_cast<std::uint32_t>(saved_rows);
	}
	if (!options.dump_cols_given && saved_cols > 0) {
		options.dump_cols = static_cast<std::uint32_t>(saved_cols);
	}
	setup_logging();
	return true;
}

int app::OnRun() {
	if (finished) {
		return exit_status;
	}
	switch (options.mode) {
		case run_mode::text:
			return run_text();
		case run_mode::dump:
			return run_dump();
		case run_mode::xml:
			return run_xml();
		case run_mode::view:
			return run_viewer();
	}
	return EXIT_BAD_USAGE;
}

int app::OnExit() {
	config_mgr.shutdown();
	delete wxLog::SetActiveTarget(nullptr);
	return wxAppConsole::OnExit();
}

void app::setup_logging() {
	wxLog::SetVerbose(options.verbose);
	if (options.mode != run_mode::view) {
		return;
	}
	// curses owns the screen, so interactive sessions log to a file instead of stderr.
	const wxString dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(dir)) {
		wxFileName::Mkdir(dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	if (!log_file.Open(wxFileName(dir, LOG_FILE_NAME).GetFullPath(), "a")) {
		wxLog::EnableLogging(false);
		return;
	}
	wxLog::SetTimestamp("%Y-%m-%d %H:%M:%S");
	delete wxLog::SetActiveTarget(new wxLogStderr(log_file.fp()));
}

int app::run_text() {
	try {
		const auto doc = load_document(options.input_path, layout, extraction);
		write_stdout(document_text(*doc, layout));
		return EXIT_OK;
	} catch (const layout_exception& e) {
		wxLogError("%s", e.get_display_message());
		return exit_code_for(e);
	}
}

int app::run_dump() {
	try {
		const auto doc = load_document(options.input_path, layout, extraction);
		const auto index = static_cast<std::size_t>(options.start_page - 1);
		if (index >= doc->page_count()) {
			wxLogError(_("Page %d does not exist; the document has %zu pages"), options.start_page, doc->page_count());
			return EXIT_BAD_USAGE;
		}
		const auto result = map_page(doc->pages[index], options.dump_rows, options.dump_cols, layout);
		for (const auto& warning : result.warnings) {
			wxLogVerbose("%s: %s", warning_kind_name(warning.kind), to_wx(warning.message));
		}
		write_stdout(result.grid.to_string());
		return EXIT_OK;
	} catch (const layout_exception& e) {
		wxLogError("%s", e.get_display_message());
		return exit_code_for(e);
	}
}

int app::run_xml() {
	try {
		write_stdout(format_alto(load_alto(options.input_path, extraction)));
		return EXIT_OK;
	} catch (const layout_exception& e) {
		wxLogError("%s", e.get_display_message());
		return exit_code_for(e);
	}
}

int app::run_viewer() {
	document_manager docs{config_mgr, layout, extraction};
	int status = EXIT_OK;
	wxString failure;
	try {
		docs.open_file(options.input_path);
		if (options.start_page > 1) {
			docs.go_to_page(static_cast<std::size_t>(options.start_page - 1));
		}
	} catch (const layout_exception& e) {
		wxLogError("%s", e.get_display_message());
		failure = e.get_display_message();
		status = exit_code_for(e);
	}
	std::unique_ptr<curses_terminal> term;
	try {
		term = std::make_unique<curses_terminal>();
	} catch (const layout_exception& e) {
		wxLogError("%s", e.get_display_message());
		return status == EXIT_OK ? EXIT_BAD_USAGE : status;
	}
	viewer view{*term, docs};
	if (!failure.IsEmpty()) {
		view.show_error(failure);
	}
	view.run();
	return status;
}

wxIMPLEMENT_APP_CONSOLE(app);
