//
//  settings.hpp
//  aberred
//
//  Created by the aberred authors on 19/08/2025.
//

#pragma once

#include <unordered_map>
#include <map>
#include <string>
#include <typeinfo>
#include <stdexcept>
#include <vector>
#include <type_traits>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <cerrno>
#include "global.hpp"
#include "log.hpp"

#define $Settings Settings::instance()

struct SettingBase {
    virtual ~SettingBase() = default;
    virtual const std::type_info& type_of() const = 0;
    virtual std::unique_ptr<SettingBase> clone() const = 0;
    virtual std::string to_string() const = 0;
};

template<typename T>
struct Setting: public SettingBase {
    T data;
    explicit Setting(T&& value) : data(std::forward<T>(value)) {}
    explicit Setting(const T& value) : data(value) {}

    const std::type_info& type_of() const override {
        return typeid(T);
    }

    std::unique_ptr<SettingBase> clone() const override {
        return std::make_unique<Setting<T>>(data);
    }

    std::string to_string() const override {
        if constexpr (std::is_same_v<T, bool>)
            return data ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::string>)
            return data;
        else
            return fmt::format("{}", data);
    }
};

class Settings: public Global<Settings> {
    std::unordered_map<std::string, std::unique_ptr<SettingBase>> _settings;
    mutable std::mutex _mutex;

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    // INI values carry no type, guess the narrowest one that parses
    void set_parsed(const std::string& key, const std::string& raw) {
        if (raw == "true" || raw == "false") {
            set(key, raw == "true");
            return;
        }
        if (!raw.empty()) {
            char *end = nullptr;
            errno = 0;
            long long integer = std::strtoll(raw.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') {
                set(key, static_cast<int>(integer));
                return;
            }
            errno = 0;
            double number = std::strtod(raw.c_str(), &end);
            if (errno == 0 && end && *end == '\0') {
                set(key, static_cast<float>(number));
                return;
            }
        }
        std::string value = raw;
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);
        set(key, value);
    }

public:
    Settings() = default;

    template<typename T>
    void set(const std::string& key, T&& value) {
        std::lock_guard<std::mutex> lock(_mutex);
        _settings[key] = std::make_unique<Setting<std::decay_t<T>>>(std::forward<T>(value));
    }

    void set(const std::string& key, const char *value) {
        set(key, std::string(value));
    }

    template<typename T>
    const T& get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _settings.find(key);
        if (it == _settings.end())
            throw std::runtime_error("Setting key '" + key + "' not found");
        auto* valuePtr = dynamic_cast<Setting<T>*>(it->second.get());
        if (!valuePtr)
            throw std::runtime_error("Type mismatch for key '" + key + "'");
        return valuePtr->data;
    }

    // Typed read with fallback, numbers convert between int and float
    template<typename T>
    T get_or(const std::string& key, const T& fallback) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _settings.find(key);
        if (it == _settings.end())
            return fallback;
        if (auto *exact = dynamic_cast<Setting<T>*>(it->second.get()))
            return exact->data;
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            if (auto *i = dynamic_cast<Setting<int>*>(it->second.get()))
                return static_cast<T>(i->data);
            if (auto *f = dynamic_cast<Setting<float>*>(it->second.get()))
                return static_cast<T>(f->data);
        }
        if constexpr (std::is_same_v<T, std::string>)
            return it->second->to_string();
        $Log.warn("[Config] '{}' has the wrong type, using the default", key);
        return fallback;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _settings.find(key) != _settings.end();
    }

    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(_mutex);
        return _settings.erase(key) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _settings.clear();
    }

    const std::type_info& type_of(const std::string& key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _settings.find(key);
        if (it == _settings.end())
            throw std::runtime_error("Setting key '" + key + "' not found");
        return it->second->type_of();
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::string> keys;
        keys.reserve(_settings.size());
        for (const auto& pair : _settings)
            keys.push_back(pair.first);
        return keys;
    }

    // Keys inside a [section] are stored as "section.key". Malformed lines
    // are reported and skipped.
    bool import_ini_string(const std::string& text, const std::string& source = "<string>") {
        std::istringstream stream(text);
        std::string line, section;
        int line_number = 0;
        bool clean = true;
        while (std::getline(stream, line)) {
            line_number++;
            std::string trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == ';' || trimmed[0] == '#')
                continue;
            if (trimmed.front() == '[') {
                if (trimmed.back() != ']') {
                    $Log.warn("[Config] {}:{}: unterminated section header", source, line_number);
                    clean = false;
                    continue;
                }
                section = trim(trimmed.substr(1, trimmed.size() - 2));
                continue;
            }
            size_t eq = trimmed.find('=');
            if (eq == std::string::npos) {
                $Log.warn("[Config] {}:{}: expected 'key = value'", source, line_number);
                clean = false;
                continue;
            }
            std::string key = trim(trimmed.substr(0, eq));
            std::string value = trim(trimmed.substr(eq + 1));
            if (key.empty()) {
                $Log.warn("[Config] {}:{}: empty key", source, line_number);
                clean = false;
                continue;
            }
            set_parsed(section.empty() ? key : section + "." + key, value);
        }
        return clean;
    }

    bool import_ini(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            $Log.warn("[Config] Could not open '{}', using defaults", path);
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return import_ini_string(buffer.str(), path);
    }

    std::string export_ini_string() const {
        std::map<std::string, std::map<std::string, std::string>> sections;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (const auto& [key, value] : _settings) {
                size_t dot = key.find('.');
                if (dot == std::string::npos)
                    sections[""][key] = value->to_string();
                else
                    sections[key.substr(0, dot)][key.substr(dot + 1)] = value->to_string();
            }
        }
        std::string out;
        for (const auto& [section, values] : sections) {
            if (!section.empty())
                out += fmt::format("[{}]\n", section);
            for (const auto& [key, value] : values)
                out += fmt::format("{} = {}\n", key, value);
            out += "\n";
        }
        return out;
    }

    bool export_ini(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            $Log.error("[Config] Could not write '{}'", path);
            return false;
        }
        file << export_ini_string();
        return true;
    }
};

struct GameConfig {
    int render_width = 640;
    int render_height = 360;
    int window_width = 1280;
    int window_height = 720;
    std::string window_title = "Aberred Engine";
    int target_fps = 120;
    bool vsync = true;
    bool fullscreen = false;
    bool audio_enabled = true;
    std::string log_level = "info";
    std::string main_script = "./assets/scripts/main.lua";
    std::string script_path = "./assets/scripts/?.lua;./assets/scripts/?/init.lua";

    static GameConfig from_settings() {
        GameConfig config;
        config.render_width = $Settings.get_or<int>("render.width", config.render_width);
        config.render_height = $Settings.get_or<int>("render.height", config.render_height);
        config.window_width = $Settings.get_or<int>("window.width", config.window_width);
        config.window_height = $Settings.get_or<int>("window.height", config.window_height);
        config.window_title = $Settings.get_or<std::string>("window.title", config.window_title);
        config.target_fps = $Settings.get_or<int>("window.target_fps", config.target_fps);
        config.vsync = $Settings.get_or<bool>("window.vsync", config.vsync);
        config.fullscreen = $Settings.get_or<bool>("window.fullscreen", config.fullscreen);
        config.audio_enabled = $Settings.get_or<bool>("audio.enabled", config.audio_enabled);
        config.log_level = $Settings.get_or<std::string>("log.level", config.log_level);
        config.main_script = $Settings.get_or<std::string>("scripts.main", config.main_script);
        config.script_path = $Settings.get_or<std::string>("scripts.path", config.script_path);
        if (config.render_width <= 0 || config.render_height <= 0) {
            $Log.warn("[Config] Invalid render size {}x{}, using 640x360", config.render_width, config.render_height);
            config.render_width = 640;
            config.render_height = 360;
        }
        return config;
    }

    void store_settings() const {
        $Settings.set("render.width", render_width);
        $Settings.set("render.height", render_height);
        $Settings.set("window.width", window_width);
        $Settings.set("window.height", window_height);
        $Settings.set("window.title", window_title);
        $Settings.set("window.target_fps", target_fps);
        $Settings.set("window.vsync", vsync);
        $Settings.set("window.fullscreen", fullscreen);
        $Settings.set("audio.enabled", audio_enabled);
        $Settings.set("log.level", log_level);
        $Settings.set("scripts.main", main_script);
        $Settings.set("scripts.path", script_path);
    }
};
