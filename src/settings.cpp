#include "settings.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <algorithm>

namespace promfile {

namespace {

constexpr int MIN_INTERVAL_MS = 10;

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

// Reads a quoted string starting at the opening quote; handles \" and \\.
// Returns npos when unterminated, otherwise the position after the closing quote.
size_t read_quoted(const std::string& content, size_t quote, std::string& out) {
    out.clear();
    for (size_t i = quote + 1; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\\' && i + 1 < content.size()) {
            char next = content[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                default:  out += next; break;
            }
        } else if (c == '"') {
            return i + 1;
        } else {
            out += c;
        }
    }
    return std::string::npos;
}

} // namespace

Settings& Settings::getInstance() {
    static Settings instance;
    return instance;
}

std::string Settings::get_default_config_path() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/prom-file-server/settings.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/prom-file-server/settings.json";
    }
    return "";
}

std::string Settings::get_config_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void Settings::ensure_defaults() {
    // Set default values if not present
    if (settings_.find("file_path") == settings_.end())
        settings_["file_path"] = "";
    if (settings_.find("listen_address") == settings_.end())
        settings_["listen_address"] = "0.0.0.0";
    if (settings_.find("listen_port") == settings_.end())
        settings_["listen_port"] = "8080";
    if (settings_.find("endpoint_path") == settings_.end())
        settings_["endpoint_path"] = "/metrics";
    if (settings_.find("symlink_poll_interval_ms") == settings_.end())
        settings_["symlink_poll_interval_ms"] = "1000";
    if (settings_.find("rewatch_delay_ms") == settings_.end())
        settings_["rewatch_delay_ms"] = "1000";
    if (settings_.find("log_level") == settings_.end())
        settings_["log_level"] = "info";
    if (settings_.find("log_file") == settings_.end())
        settings_["log_file"] = "";
}

void Settings::parse(const std::string& content) {
    // Parse JSON-like format: {"key": "value", "key": 123, ...}
    // Only a flat object is supported; nested values are skipped.
    size_t pos = content.find('{');
    if (pos == std::string::npos) {
        Logger::warn("[Settings] No JSON object found in settings file");
        return;
    }
    ++pos;
    
    while ((pos = content.find('"', pos)) != std::string::npos) {
        std::string key;
        size_t key_end = read_quoted(content, pos, key);
        if (key_end == std::string::npos) break;
        
        // Find colon
        size_t colon = content.find(':', key_end);
        if (colon == std::string::npos) break;
        
        size_t val_start = content.find_first_not_of(" \t\r\n", colon + 1);
        if (val_start == std::string::npos) break;
        
        std::string value;
        if (content[val_start] == '"') {
            pos = read_quoted(content, val_start, value);
            if (pos == std::string::npos) break;
        } else if (content[val_start] == '{' || content[val_start] == '[') {
            Logger::warn("[Settings] Ignoring nested value for key " + key);
            char open = content[val_start];
            char close_char = open == '{' ? '}' : ']';
            size_t val_end = content.find(close_char, val_start);
            if (val_end == std::string::npos) break;
            pos = val_end + 1;
            continue;
        } else {
            // Non-string value (number, boolean)
            size_t val_end = content.find_first_of(",}", val_start);
            if (val_end == std::string::npos) val_end = content.length();
            value = trim(content.substr(val_start, val_end - val_start));
            pos = val_end;
        }
        
        settings_[key] = value;
    }
}

bool Settings::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    settings_.clear();
    config_path_ = path.empty() ? get_default_config_path() : path;
    
    if (config_path_.empty()) {
        Logger::warn("[Settings] No config path available, using defaults");
        ensure_defaults();
        return false;
    }
    
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file at " + config_path_ + ", using defaults");
        ensure_defaults();
        return false;
    }
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
    
    ensure_defaults();
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings from " + config_path_);
    return true;
}

std::string Settings::get_file_path() const {
    return get_string("file_path");
}

std::string Settings::get_listen_address() const {
    return get_string("listen_address", "0.0.0.0");
}

int Settings::get_listen_port() const {
    return std::clamp(get_int("listen_port", 8080), 1, 65535);
}

std::string Settings::get_endpoint_path() const {
    std::string endpoint = get_string("endpoint_path", "/metrics");
    if (endpoint.empty() || endpoint[0] != '/') {
        endpoint = "/" + endpoint;
    }
    return endpoint;
}

int Settings::get_symlink_poll_interval_ms() const {
    return std::max(MIN_INTERVAL_MS, get_int("symlink_poll_interval_ms", 1000));
}

int Settings::get_rewatch_delay_ms() const {
    return std::max(MIN_INTERVAL_MS, get_int("rewatch_delay_ms", 1000));
}

std::string Settings::get_log_level() const {
    return get_string("log_level", "info");
}

std::string Settings::get_log_file() const {
    return get_string("log_file");
}

// Generic getters/setters
std::string Settings::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : default_value;
}

void Settings::set_string(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[key] = value;
}

int Settings::get_int(const std::string& key, int default_value) const {
    std::string val = get_string(key);
    if (val.empty()) return default_value;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != val.size()) {
            Logger::warn("[Settings] Invalid integer for " + key + ": " + val);
            return default_value;
        }
        return parsed;
    } catch (const std::exception&) {
        Logger::warn("[Settings] Invalid integer for " + key + ": " + val);
        return default_value;
    }
}

void Settings::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

} // namespace promfile
