/* alto_parser.cpp - ALTO layout description parser implementation.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "alto_parser.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <wx/ffile.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

std::unique_ptr<document> alto_parser::parse(const std::string& xml_content) {
	reset();
	pugi::xml_document xml;
	const auto result = xml.load_buffer(xml_content.data(), xml_content.size(), pugi::parse_default, pugi::encoding_auto);
	if (!result) {
		fail(wxString::Format(_("Layout description is not well-formed XML (%s at offset %ld)"), result.description(), static_cast<long>(result.offset)), parse_error_code::malformed_structure);
	}
	process_node(xml);
	if (doc->pages.empty()) {
		fail(_("Layout description contains no pages"), parse_error_code::malformed_structure);
	}
	if (doc->fragment_count() == 0) {
		if (strings_seen > 0 && strings_bad_encoding == strings_seen) {
			fail(_("No text fragment in the layout description is valid UTF-8"), parse_error_code::encoding_error);
		}
		fail(_("No page of the layout description contains any text"), parse_error_code::malformed_structure);
	}
	const bool any_page_size = std::ranges::any_of(doc->pages, [](const page& pg) {
		return pg.width > 0.0 && pg.height > 0.0;
	});
	if (!any_geometry && !any_page_size) {
		fail(_("Layout description carries no geometry"), parse_error_code::missing_geometry);
	}
	if (doc->title == "Untitled" && !source_path.IsEmpty()) {
		doc->title = wxFileName(source_path).GetName();
	}
	doc->source_path = source_path;
	wxLogVerbose("Parsed %zu pages, %zu fragments, %zu warnings from %s", doc->page_count(), doc->fragment_count(), doc->warning_count(), source_path);
	return std::move(doc);
}

void alto_parser::reset() {
	doc = std::make_unique<document>();
	current.reset();
	next_hint = 0;
	strings_seen = 0;
	strings_bad_encoding = 0;
	any_geometry = false;
}

void alto_parser::process_node(pugi::xml_node node) {
	if (node == nullptr) {
		return;
	}
	if (node.type() != pugi::node_element && node.type() != pugi::node_document) {
		return;
	}
	const std::string tag_name = get_local_name(node.name());
	if (tag_name == "Page" && !current) {
		begin_page(node);
		for (auto child : node.children()) {
			process_node(child);
		}
		end_page();
		return;
	}
	if (tag_name == "fileName" && !current) {
		const std::string file_name = trim_string(node.child_value());
		if (!file_name.empty()) {
			doc->title = wxFileName(to_wx(file_name)).GetName();
		}
		return;
	}
	if (current) {
		if (tag_name == "String") {
			process_string(node);
			return;
		}
		if (tag_name == "PrintSpace") {
			// The print space only stands in for the page size when the page omits it.
			const auto hpos = numeric_attribute(node, "HPOS");
			const auto vpos = numeric_attribute(node, "VPOS");
			const auto width = numeric_attribute(node, "WIDTH");
			const auto height = numeric_attribute(node, "HEIGHT");
			if (!current->declared_width && width) {
				current->declared_width = hpos.value_or(0.0) + *width;
			}
			if (!current->declared_height && height) {
				current->declared_height = vpos.value_or(0.0) + *height;
			}
		} else if (tag_name == "TextLine") {
			const auto saved = current->line_baseline;
			current->line_baseline = numeric_attribute(node, "BASELINE");
			for (auto child : node.children()) {
				process_node(child);
			}
			current->line_baseline = saved;
			return;
		}
	}
	for (auto child : node.children()) {
		process_node(child);
	}
}

void alto_parser::begin_page(pugi::xml_node node) {
	current.emplace();
	current->pg.index = static_cast<std::uint32_t>(doc->pages.size());
	const auto width = numeric_attribute(node, "WIDTH");
	const auto height = numeric_attribute(node, "HEIGHT");
	if (width && *width > 0.0) {
		current->declared_width = width;
	}
	if (height && *height > 0.0) {
		current->declared_height = height;
	}
}

void alto_parser::end_page() {
	auto& pg = current->pg;
	if (current->declared_width && current->declared_height) {
		pg.width = *current->declared_width;
		pg.height = *current->declared_height;
	} else {
		double extent_x{0.0};
		double extent_y{0.0};
		for (const auto& frag : pg.fragments) {
			extent_x = std::max(extent_x, frag.bbox.right());
			extent_y = std::max(extent_y, frag.bbox.bottom());
		}
		pg.width = current->declared_width.value_or(extent_x);
		pg.height = current->declared_height.value_or(extent_y);
		add_warning(warning_kind::geometry_defaulted, wxString::Format("page %u has no dimensions, using its content extent", pg.index + 1).ToStdString());
	}
	for (auto& frag : pg.fragments) {
		if (frag.bbox.within(pg.width, pg.height)) {
			continue;
		}
		frag.bbox = frag.bbox.clamped_to(pg.width, pg.height);
		frag.baseline = std::clamp(frag.baseline, 0.0, pg.height);
		add_warning(warning_kind::fragment_clamped, "fragment \"" + frag.text + "\" lies outside the page");
	}
	doc->pages.push_back(std::move(pg));
	current.reset();
}

void alto_parser::process_string(pugi::xml_node node) {
	const std::string content = node.attribute("CONTENT").as_string();
	if (content.empty()) {
		return;
	}
	++strings_seen;
	if (!is_valid_utf8(content)) {
		++strings_bad_encoding;
		add_warning(warning_kind::invalid_encoding, "dropped a fragment whose text is not valid UTF-8");
		return;
	}
	std::string text = trim_string(collapse_whitespace(remove_soft_hyphens(content)));
	if (text.empty()) {
		return;
	}
	const auto hpos = numeric_attribute(node, "HPOS");
	const auto vpos = numeric_attribute(node, "VPOS");
	const auto width = numeric_attribute(node, "WIDTH");
	const auto height = numeric_attribute(node, "HEIGHT");
	raw_fragment frag;
	frag.bbox = {hpos.value_or(0.0), vpos.value_or(0.0), std::max(0.0, width.value_or(0.0)), std::max(0.0, height.value_or(0.0))};
	frag.baseline = current->line_baseline.value_or(frag.bbox.bottom());
	frag.hint_order = next_hint++;
	if (!hpos || !vpos || !width || !height) {
		add_warning(warning_kind::geometry_defaulted, "fragment \"" + text + "\" has missing or invalid geometry");
	}
	if (frag.bbox.x != 0.0 || frag.bbox.y != 0.0 || frag.bbox.width > 0.0 || frag.bbox.height > 0.0) {
		any_geometry = true;
	}
	frag.text = std::move(text);
	current->pg.fragments.push_back(std::move(frag));
}

void alto_parser::add_warning(warning_kind kind, std::string message) {
	const std::uint32_t index = current ? current->pg.index : 0;
	wxLogVerbose("Page %u: %s", index + 1, to_wx(message));
	if (current) {
		current->pg.warnings.push_back({.kind = kind, .page_index = index, .message = std::move(message)});
	}
}

void alto_parser::fail(const wxString& message, parse_error_code code) const {
	throw layout_exception(message, source_path, error_kind::parse, code);
}

std::string alto_parser::get_local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string s(qname);
	auto pos = s.find(':');
	return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::optional<double> alto_parser::numeric_attribute(pugi::xml_node node, const char* name) {
	const auto attr = node.attribute(name);
	if (!attr) {
		return std::nullopt;
	}
	return parse_number(attr.value());
}

std::unique_ptr<document> parse_alto(const std::string& xml_content, const wxString& source_path) {
	alto_parser parser{source_path};
	return parser.parse(xml_content);
}

std::string read_alto_file(const wxString& path) {
	wxFFile file(path, "rb");
	if (!file.IsOpened()) {
		throw layout_exception(_("Failed to open layout description"), path, error_kind::conversion);
	}
	const wxFileOffset length = file.Length();
	if (length <= 0) {
		throw layout_exception(_("Layout description is empty"), path, error_kind::conversion);
	}
	std::string content(static_cast<std::size_t>(length), '\0');
	if (file.Read(content.data(), content.size()) != content.size()) {
		throw layout_exception(_("Failed to read layout description"), path, error_kind::conversion);
	}
	return content;
}

std::unique_ptr<document> parse_alto_file(const wxString& path) {
	return parse_alto(read_alto_file(path), path);
}

std::string format_alto(const std::string& xml_content) {
	pugi::xml_document xml;
	if (!xml.load_buffer(xml_content.data(), xml_content.size())) {
		return xml_content;
	}
	std::ostringstream oss;
	xml.save(oss, "  ");
	return oss.str();
}
