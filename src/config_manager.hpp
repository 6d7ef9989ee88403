/* config_manager.hpp - config management header file.
 *
 * Pagegrid.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "layout_config.hpp"
#include <functional>
#include <memory>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static constexpr app_setting<int> config_version{"version", 0};
	static constexpr app_setting<bool> remember_page{"remember_page", true};
	static constexpr app_setting<int> dump_rows{"dump_rows", DEFAULT_DUMP_ROWS};
	static constexpr app_setting<int> dump_cols{"dump_cols", DEFAULT_DUMP_COLS};
	static inline const app_setting<wxString> extractor_path{"extractor_path", DEFAULT_EXTRACTOR};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// Opens the INI file at path, or at the default location when path is empty.
	bool initialize(const wxString& path = wxEmptyString);
	void flush();
	void shutdown();

	[[nodiscard]] wxFileConfig* get_config() const {
		return config.get();
	}

	[[nodiscard]] bool is_initialized() const {
		return config != nullptr;
	}

	[[nodiscard]] const wxString& get_path() const noexcept {
		return config_path;
	}

	template <typename T>
	[[nodiscard]] T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.key), value);
	}

	// Thresholds from the layout group; missing or invalid entries fall back to the defaults.
	[[nodiscard]] layout_config load_layout_config() const;
	void save_layout_config(const layout_config& layout);
	void set_document_page(const wxString& path, int page_index);
	[[nodiscard]] int get_document_page(const wxString& path) const;
	void remove_document_history(const wxString& path);
	[[nodiscard]] bool has_document_history(const wxString& path) const;
	static wxString get_document_section(const wxString& path);

private:
	std::unique_ptr<wxFileConfig> config;
	wxString config_path;
	bool owns_global_config{false};

	template <typename T>
	T get_app_setting(const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& key, const T& value);
	template <typename T>
	T get_document_setting(const wxString& path, const wxString& key, const T& default_value) const;
	template <typename T>
	void set_document_setting(const wxString& path, const wxString& key, const T& value);
	static wxString get_default_config_path();
	static bool is_directory_writable(const wxString& dir);
	void load_defaults();
	static wxString escape_document_path(const wxString& path);
	// Runs func with the config path set to group, then returns to the root.
	void with_section(const wxString& group, const std::function<void()>& func) const;
};
