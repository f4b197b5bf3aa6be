#pragma once

#include <string>
#include <map>
#include <mutex>

namespace promfile {

/**
 * Server Settings
 *
 * Flat key/value configuration read from a JSON object file:
 * - file_path                 file to serve (required)
 * - listen_address, listen_port
 * - endpoint_path             HTTP path serving the file
 * - symlink_poll_interval_ms  how often symlinks are re-read
 * - rewatch_delay_ms          pause before retrying a failed watch
 * - log_level, log_file
 *
 * Default location: $XDG_CONFIG_HOME/prom-file-server/settings.json
 * Command line options override file values through set_string().
 */
class Settings {
public:
    static Settings& getInstance();
    
    // Load from the default location, or from `path` when not empty.
    // Previously loaded or overridden values are discarded.
    // A missing file is not an error: defaults are used and false returned.
    bool load(const std::string& path = "");
    
    std::string get_file_path() const;
    std::string get_listen_address() const;
    int get_listen_port() const;
    std::string get_endpoint_path() const;
    int get_symlink_poll_interval_ms() const;
    int get_rewatch_delay_ms() const;
    std::string get_log_level() const;
    std::string get_log_file() const;
    
    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);
    
    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);
    
    // Path of the default settings file
    std::string get_default_config_path() const;
    
    // Path actually used by the last load()
    std::string get_config_path() const;
    
private:
    Settings() = default;
    ~Settings() = default;
    
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;
    
    void ensure_defaults();
    void parse(const std::string& content);
    
    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_path_;
};

} // namespace promfile
