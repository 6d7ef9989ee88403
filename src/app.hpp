/* app.hpp - wxAppConsole implementation header.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "command_line.hpp"
#include "config_manager.hpp"
#include "extractor.hpp"
#include "layout_config.hpp"
#include <wx/app.h>
#include <wx/ffile.h>

class app : public wxAppConsole {
public:
	app() = default;
	~app() override = default;
	app(const app&) = delete;
	app& operator=(const app&) = delete;
	app(app&&) = delete;
	app& operator=(app&&) = delete;
	bool OnInit() override;
	int OnRun() override;
	int OnExit() override;

	[[nodiscard]] config_manager& get_config_manager() {
		return config_mgr;
	}

private:
	config_manager config_mgr;
	run_options options;
	layout_config layout;
	extractor_options extraction;
	wxFFile log_file;
	int exit_status{EXIT_OK};
	bool finished{false};

	void setup_logging();
	int run_text();
	int run_dump();
	int run_xml();
	int run_viewer();
};

wxDECLARE_APP(app);
