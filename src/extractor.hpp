/* extractor.hpp - external PDF layout extractor header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <optional>
#include <string>
#include <wx/string.h>

struct extractor_options {
	wxString executable{DEFAULT_EXTRACTOR};
	// 1-based page range handed to the extractor; both unset converts the whole file.
	std::optional<int> first_page;
	std::optional<int> last_page;
};

// Temporary directory holding the extractor's output and its side files, removed with everything in it on destruction.
class extraction_artifacts {
public:
	extraction_artifacts();
	~extraction_artifacts();
	extraction_artifacts(const extraction_artifacts&) = delete;
	extraction_artifacts& operator=(const extraction_artifacts&) = delete;
	extraction_artifacts(extraction_artifacts&&) = delete;
	extraction_artifacts& operator=(extraction_artifacts&&) = delete;

	[[nodiscard]] const wxString& directory() const noexcept {
		return dir;
	}

	[[nodiscard]] wxString output_path() const;

private:
	wxString dir;
};

[[nodiscard]] wxString build_extractor_command(const wxString& pdf_path, const wxString& output_path, const extractor_options& options);
// Runs the extractor on a PDF and returns its ALTO XML. Throws layout_exception (conversion) on any failure.
[[nodiscard]] std::string extract_alto(const wxString& pdf_path, const extractor_options& options = {});
