#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace castle {

/**
 * @brief Runtime configuration for castlegen
 *
 * Flat key = value store read from a config file. Keys in use:
 *   log.level, log.file, log.console   logger setup in the CLI
 *   profile.name, profile.*            BrowserProfile::from_config
 *   token.user_agent                   default --ua
 * Wire-format constants of the token are never read from here.
 * Thread-safe singleton; tests may also construct a local instance.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config() { loadDefaults(); }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    /// Value parsed as int; default_val when absent or not a number
    int getInt(const std::string& key, int default_val = 0) const {
        const std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::logic_error&) { return default_val; }
    }

    double getDouble(const std::string& key, double default_val = 0.0) const {
        const std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stod(v); }
        catch (const std::logic_error&) { return default_val; }
    }

    /// true, 1, yes and on (any case) are true
    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "true" || v == "1" || v == "yes" || v == "on";
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    /**
     * @brief Merge key = value lines from a file over the current values
     *
     * Lines starting with '#' or ';' and lines without '=' are skipped.
     * @return false if the file cannot be opened
     */
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::lock_guard<std::mutex> lock(mtx_);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            const auto pos = line.find('=');
            if (pos == std::string::npos) continue;
            values_[trim(line.substr(0, pos))] = trim(line.substr(pos + 1));
        }
        return true;
    }

private:
    void loadDefaults() {
        values_["log.level"]    = "info";
        values_["log.file"]     = "";
        values_["log.console"]  = "true";
        values_["profile.name"] = "chrome_windows";
    }

    static std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace castle
