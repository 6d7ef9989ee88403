/* layout_config.hpp - layout thresholds and display options.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once

enum class aspect_mode {
	// Vertical scale follows the horizontal one divided by the cell aspect ratio, never overflowing the grid.
	preserve,
	// Page stretched to fill the grid in both directions.
	fit
};

enum class column_anchor {
	center,
	left
};

// Tuning values for reading-order reconstruction and grid mapping.
// Distances are relative to fragment heights or to the page's median character width,
// so the defaults hold regardless of the extractor's measurement unit.
struct layout_config {
	// Two fragments share a band when their centers are closer than this fraction of the smaller height.
	double band_tolerance{0.5};
	// Height assumed for zero-height fragments when banding.
	double min_fragment_height{1.0};
	// A column gap must be wider than this many median character widths.
	double column_gap_factor{1.5};
	// Bands wider than this fraction of the content width are left out of the gap profile.
	double spanning_width_ratio{0.6};
	// Fraction of profiled segments allowed to cross a gap before it stops counting as empty.
	double gap_noise_ratio{0.1};
	// Minimum number of lines on each side of a gap for it to become a column boundary.
	int min_column_lines{2};
	// Width of one bin of the horizontal coverage profile, in page units.
	double profile_bin_size{1.0};
	// Words overlapping by more than this fraction of the narrower width are duplicates.
	double overlap_tolerance{0.5};
	// Gap, in median character widths, above which a space separates two words in line text.
	double space_threshold{0.1};
	// Vertical gap, in line heights, that starts a new paragraph in text export.
	double paragraph_gap_factor{1.0};
	int max_blank_lines{3};
	// Upper bound on the rows a scrolling view maps one page into.
	int max_natural_rows{1000};
	// Terminal cell height divided by its width.
	double cell_aspect_ratio{2.0};
	aspect_mode aspect{aspect_mode::preserve};
	column_anchor anchor{column_anchor::center};
};
