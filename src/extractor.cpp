/* extractor.cpp - runs the external PDF layout extractor.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "extractor.hpp"
#include "constants.hpp"
#include "layout_error.hpp"
#include <cstddef>
#include <string>
#include <wx/arrstr.h>
#include <wx/ffile.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/utils.h>

namespace {
wxString quote_argument(const wxString& arg) {
	wxString escaped = arg;
	escaped.Replace("\\", "\\\\");
	escaped.Replace("\"", "\\\"");
	return "\"" + escaped + "\"";
}

std::string read_output(const wxString& path, const wxString& pdf_path) {
	if (!wxFileName::FileExists(path)) {
		throw layout_exception(_("Extractor produced no output"), pdf_path, error_kind::conversion);
	}
	wxFFile file(path, "rb");
	if (!file.IsOpened()) {
		throw layout_exception(_("Failed to open extractor output"), pdf_path, error_kind::conversion);
	}
	const wxFileOffset length = file.Length();
	if (length <= 0) {
		throw layout_exception(_("Extractor produced an empty output"), pdf_path, error_kind::conversion);
	}
	std::string content(static_cast<std::size_t>(length), '\0');
	if (file.Read(content.data(), content.size()) != content.size()) {
		throw layout_exception(_("Failed to read extractor output"), pdf_path, error_kind::conversion);
	}
	return content;
}
} // namespace

extraction_artifacts::extraction_artifacts() {
	const wxString placeholder = wxFileName::CreateTempFileName(APP_NAME);
	if (placeholder.IsEmpty()) {
		throw layout_exception(_("Failed to create a temporary file"), error_kind::conversion);
	}
	// Reuse the unique name for a directory so the extractor's side files land in it too.
	wxRemoveFile(placeholder);
	if (!wxFileName::Mkdir(placeholder, wxS_DIR_DEFAULT)) {
		throw layout_exception(_("Failed to create a temporary directory"), placeholder, error_kind::conversion);
	}
	dir = placeholder;
}

extraction_artifacts::~extraction_artifacts() {
	if (dir.IsEmpty() || !wxFileName::DirExists(dir)) {
		return;
	}
	if (!wxFileName::Rmdir(dir, wxPATH_RMDIR_RECURSIVE)) {
		wxLogWarning("Could not remove temporary directory %s", dir);
	}
}

wxString extraction_artifacts::output_path() const {
	return wxFileName(dir, "page.xml").GetFullPath();
}

wxString build_extractor_command(const wxString& pdf_path, const wxString& output_path, const extractor_options& options) {
	wxString command = quote_argument(options.executable) + " -noImage -noLineNumbers -readingOrder";
	if (options.first_page) {
		command += wxString::Format(" -f %d", *options.first_page);
	}
	if (options.last_page) {
		command += wxString::Format(" -l %d", *options.last_page);
	}
	command += " " + quote_argument(pdf_path) + " " + quote_argument(output_path);
	return command;
}

std::string extract_alto(const wxString& pdf_path, const extractor_options& options) {
	if (!wxFileName::FileExists(pdf_path)) {
		throw layout_exception(_("File not found"), pdf_path, error_kind::conversion);
	}
	const wxFileName exe(options.executable);
	if (exe.HasVolume() || !exe.GetPath().IsEmpty()) {
		if (!exe.FileExists()) {
			throw layout_exception(wxString::Format(_("Extractor %s not found"), options.executable), pdf_path, error_kind::conversion);
		}
	}
	extraction_artifacts artifacts;
	const wxString output_path = artifacts.output_path();
	const wxString command = build_extractor_command(pdf_path, output_path, options);
	wxLogVerbose("Running %s", command);
	wxArrayString output;
	wxArrayString errors;
	const long status = wxExecute(command, output, errors, wxEXEC_SYNC | wxEXEC_NODISABLE);
	for (const auto& line : errors) {
		wxLogVerbose("%s: %s", options.executable, line);
	}
	if (status == -1) {
		throw layout_exception(wxString::Format(_("Failed to launch %s"), options.executable), pdf_path, error_kind::conversion);
	}
	if (status != 0) {
		throw layout_exception(wxString::Format(_("%s exited with status %ld"), options.executable, status), pdf_path, error_kind::conversion);
	}
	return read_output(output_path, pdf_path);
}
