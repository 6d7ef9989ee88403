/* constants.hpp - contains app-wide constants.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <wx/string.h>

inline const wxString APP_NAME = "Pagegrid";
inline const wxString APP_VERSION = "0.1";
inline const wxString SAMPLE_FILE_NAME = "sample.xml";
inline const wxString LOG_FILE_NAME = "pagegrid.log";
inline const wxString DEFAULT_EXTRACTOR = "pdfalto";
inline constexpr int CONFIG_VERSION_CURRENT = 1;
inline constexpr int DEFAULT_DUMP_ROWS = 50;
inline constexpr int DEFAULT_DUMP_COLS = 100;

enum exit_code {
	EXIT_OK = 0,
	EXIT_BAD_USAGE = 1,
	EXIT_EXTRACTION_FAILED = 2,
	EXIT_PARSE_FAILED = 3,
};
