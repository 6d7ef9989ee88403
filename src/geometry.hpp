/* geometry.hpp - page-space bounding boxes.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <algorithm>

struct bounding_box {
	double x{0.0};
	double y{0.0};
	double width{0.0};
	double height{0.0};

	[[nodiscard]] constexpr double right() const noexcept {
		return x + width;
	}

	[[nodiscard]] constexpr double bottom() const noexcept {
		return y + height;
	}

	[[nodiscard]] constexpr double center_x() const noexcept {
		return x + width / 2.0;
	}

	[[nodiscard]] constexpr double center_y() const noexcept {
		return y + height / 2.0;
	}

	[[nodiscard]] constexpr bool empty() const noexcept {
		return width <= 0.0 && height <= 0.0;
	}

	[[nodiscard]] constexpr bool operator==(const bounding_box& other) const noexcept = default;

	// Smallest box containing both.
	[[nodiscard]] constexpr bounding_box united(const bounding_box& other) const noexcept {
		const double left = std::min(x, other.x);
		const double top = std::min(y, other.y);
		return {left, top, std::max(right(), other.right()) - left, std::max(bottom(), other.bottom()) - top};
	}

	[[nodiscard]] constexpr bounding_box clamped_to(double page_width, double page_height) const noexcept {
		const double left = std::clamp(x, 0.0, page_width);
		const double top = std::clamp(y, 0.0, page_height);
		const double r = std::clamp(right(), left, page_width);
		const double b = std::clamp(bottom(), top, page_height);
		return {left, top, r - left, b - top};
	}

	[[nodiscard]] constexpr bool within(double page_width, double page_height) const noexcept {
		return x >= 0.0 && y >= 0.0 && right() <= page_width && bottom() <= page_height;
	}

	// Length of the shared x range, zero when disjoint.
	[[nodiscard]] constexpr double horizontal_overlap(const bounding_box& other) const noexcept {
		return std::max(0.0, std::min(right(), other.right()) - std::max(x, other.x));
	}

	[[nodiscard]] constexpr double vertical_overlap(const bounding_box& other) const noexcept {
		return std::max(0.0, std::min(bottom(), other.bottom()) - std::max(y, other.y));
	}
};
