/* config_manager.cpp - config management implementation.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <cmath>
#include <cstddef>
#include <functional>
#include <mbedtls/sha1.h>
#include <mbedtls/version.h>
#include <string>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
constexpr std::size_t SHA1_DIGEST_SIZE = 20;

int sha1_compute(const unsigned char* data, std::size_t len, unsigned char out[SHA1_DIGEST_SIZE]) {
#if MBEDTLS_VERSION_NUMBER >= 0x03000000
	return mbedtls_sha1(data, len, out);
#else
	return mbedtls_sha1_ret(data, len, out);
#endif
}

inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline double read_config_value(wxFileConfig* cfg, const wxString& key, double default_val) {
	const double value = cfg->ReadDouble(key, default_val);
	return std::isfinite(value) ? value : default_val;
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}

const char* aspect_mode_name(aspect_mode mode) {
	return mode == aspect_mode::fit ? "fit" : "preserve";
}

const char* column_anchor_name(column_anchor anchor) {
	return anchor == column_anchor::left ? "left" : "center";
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	config_path = path.IsEmpty() ? get_default_config_path() : path;
	config = std::make_unique<wxFileConfig>(APP_NAME, "", config_path, "", wxCONFIG_USE_LOCAL_FILE);
	if (wxConfigBase::Get(false) == nullptr) {
		wxConfigBase::Set(config.get());
		owns_global_config = true;
	}
	load_defaults();
	wxLogVerbose("Using configuration file %s", config_path);
	return true;
}

void config_manager::flush() {
	if (!config) {
		return;
	}
	config->Flush();
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	if (owns_global_config) {
		wxConfigBase::Set(nullptr);
		owns_global_config = false;
	}
	config.reset();
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	T result = default_value;
	with_section("/app", [this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	with_section("/app", [this, &key, &value]() {
		config->Write(key, value);
	});
}

template <typename T>
T config_manager::get_document_setting(const wxString& path, const wxString& key, const T& default_value) const {
	T result = default_value;
	with_section(get_document_section(path), [this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_document_setting(const wxString& path, const wxString& key, const T& value) {
	with_section(get_document_section(path), [this, &path, &key, &value]() {
		config->Write("path", path);
		config->Write(key, value);
	});
}

layout_config config_manager::load_layout_config() const {
	layout_config layout;
	with_section("/layout", [this, &layout]() {
		auto* cfg = config.get();
		layout.band_tolerance = read_config_value(cfg, "band_tolerance", layout.band_tolerance);
		layout.min_fragment_height = read_config_value(cfg, "min_fragment_height", layout.min_fragment_height);
		layout.column_gap_factor = read_config_value(cfg, "column_gap_factor", layout.column_gap_factor);
		layout.spanning_width_ratio = read_config_value(cfg, "spanning_width_ratio", layout.spanning_width_ratio);
		layout.gap_noise_ratio = read_config_value(cfg, "gap_noise_ratio", layout.gap_noise_ratio);
		layout.min_column_lines = read_config_value(cfg, "min_column_lines", layout.min_column_lines);
		layout.profile_bin_size = read_config_value(cfg, "profile_bin_size", layout.profile_bin_size);
		layout.overlap_tolerance = read_config_value(cfg, "overlap_tolerance", layout.overlap_tolerance);
		layout.space_threshold = read_config_value(cfg, "space_threshold", layout.space_threshold);
		layout.paragraph_gap_factor = read_config_value(cfg, "paragraph_gap_factor", layout.paragraph_gap_factor);
		layout.max_blank_lines = read_config_value(cfg, "max_blank_lines", layout.max_blank_lines);
		layout.max_natural_rows = read_config_value(cfg, "max_natural_rows", layout.max_natural_rows);
		layout.cell_aspect_ratio = read_config_value(cfg, "cell_aspect_ratio", layout.cell_aspect_ratio);
		const wxString aspect = read_config_value(cfg, "aspect", wxString(aspect_mode_name(layout.aspect)));
		layout.aspect = aspect.IsSameAs("fit", false) ? aspect_mode::fit : aspect_mode::preserve;
		const wxString anchor = read_config_value(cfg, "anchor", wxString(column_anchor_name(layout.anchor)));
		layout.anchor = anchor.IsSameAs("left", false) ? column_anchor::left : column_anchor::center;
	});
	if (layout.cell_aspect_ratio <= 0.0) {
		wxLogWarning("Ignoring non-positive cell_aspect_ratio in %s", config_path);
		layout.cell_aspect_ratio = layout_config{}.cell_aspect_ratio;
	}
	if (layout.profile_bin_size <= 0.0) {
		layout.profile_bin_size = layout_config{}.profile_bin_size;
	}
	if (layout.max_natural_rows < 1) {
		layout.max_natural_rows = layout_config{}.max_natural_rows;
	}
	return layout;
}

void config_manager::save_layout_config(const layout_config& layout) {
	with_section("/layout", [this, &layout]() {
		config->Write("band_tolerance", layout.band_tolerance);
		config->Write("min_fragment_height", layout.min_fragment_height);
		config->Write("column_gap_factor", layout.column_gap_factor);
		config->Write("spanning_width_ratio", layout.spanning_width_ratio);
		config->Write("gap_noise_ratio", layout.gap_noise_ratio);
		config->Write("min_column_lines", layout.min_column_lines);
		config->Write("profile_bin_size", layout.profile_bin_size);
		config->Write("overlap_tolerance", layout.overlap_tolerance);
		config->Write("space_threshold", layout.space_threshold);
		config->Write("paragraph_gap_factor", layout.paragraph_gap_factor);
		config->Write("max_blank_lines", layout.max_blank_lines);
		config->Write("max_natural_rows", layout.max_natural_rows);
		config->Write("cell_aspect_ratio", layout.cell_aspect_ratio);
		config->Write("aspect", wxString(aspect_mode_name(layout.aspect)));
		config->Write("anchor", wxString(column_anchor_name(layout.anchor)));
	});
}

void config_manager::set_document_page(const wxString& path, int page_index) {
	set_document_setting(path, "last_page", page_index);
}

int config_manager::get_document_page(const wxString& path) const {
	return get_document_setting(path, "last_page", 0);
}

void config_manager::remove_document_history(const wxString& path) {
	if (!config) {
		return;
	}
	const wxString section = get_document_section(path);
	if (config->HasGroup(section)) {
		config->DeleteGroup(section);
	}
}

bool config_manager::has_document_history(const wxString& path) const {
	return config && config->HasGroup(get_document_section(path));
}

wxString config_manager::get_default_config_path() {
	const wxString exe_dir = wxFileName(wxStandardPaths::Get().GetExecutablePath()).GetPath();
	if (is_directory_writable(exe_dir)) {
		return exe_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
	}
	const wxString appdata_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(appdata_dir)) {
		wxFileName::Mkdir(appdata_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return appdata_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
}

bool config_manager::is_directory_writable(const wxString& dir) {
	const wxFileName fn(dir, wxEmptyString);
	return fn.IsDirWritable();
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(remember_page);
	set_default_if_missing(dump_rows);
	set_default_if_missing(dump_cols);
	set_default_if_missing(extractor_path);
	if (!config->HasGroup("/layout")) {
		save_layout_config(layout_config{});
	}
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, CONFIG_VERSION_CURRENT);
	}
}

wxString config_manager::get_document_section(const wxString& path) {
	return "/" + escape_document_path(path);
}

wxString config_manager::escape_document_path(const wxString& path) {
	unsigned char digest[SHA1_DIGEST_SIZE]{};
	const std::string utf8(path.utf8_str());
	if (sha1_compute(reinterpret_cast<const unsigned char*>(utf8.data()), utf8.size(), digest) != 0) {
		// Hashing only fails on a broken mbedtls build; fall back to a sanitized path.
		wxString name = path;
		name.Replace("/", "_");
		name.Replace("\\", "_");
		return "doc_" + name;
	}
	wxString name = "doc_";
	for (const unsigned char byte : digest) {
		name += wxString::Format("%02x", static_cast<unsigned>(byte));
	}
	return name;
}

void config_manager::with_section(const wxString& group, const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath(group);
	func();
	config->SetPath("/");
}
