#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "knowmap/logging.hpp"

namespace knowmap {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                LOG_WARN("Config file not found: ", config_file);
            } else {
                load_from_file(config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.find(key) != values_.end();
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                // stoull accepts a leading '-' and wraps it
                if (it->second.find('-') != std::string::npos) {
                    throw std::invalid_argument(it->second);
                }
                return static_cast<uint64_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        set_if_env("flatten.mu", "KNOWMAP_MU");
        set_if_env("flatten.clusters", "KNOWMAP_CLUSTERS");
        set_if_env("flatten.knn", "KNOWMAP_KNN");
        set_if_env("flatten.margin", "KNOWMAP_MARGIN");
        set_if_env("flatten.seed", "KNOWMAP_SEED");
        set_if_env("flatten.max_cluster_size", "KNOWMAP_MAX_CLUSTER_SIZE");
        set_if_env("flatten.subsample", "KNOWMAP_SUBSAMPLE");

        set_if_env("log.level", "KNOWMAP_LOG_LEVEL");
        set_if_env("perf.max_threads", "KNOWMAP_MAX_THREADS");  // 0 = auto-detect
    }

    void set_if_env(const std::string& key, const std::string& env_var) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    static void trim(std::string& s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
    }

    // key = value lines; '#' and ';' start comments. File values override the environment.
    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        auto it = values_.find("log.level");
        if (it != values_.end()) {
            const std::string& level = it->second;
            if (level != "debug" && level != "info" && level != "warn" && level != "error") {
                LOG_WARN("Unknown log level '", level, "', defaulting to 'info'");
                it->second = "info";
            }
        }

        if (get_unlocked<int>("perf.max_threads", 0) < 0) {
            LOG_ERROR("Invalid perf.max_threads: ", values_["perf.max_threads"]);
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration and apply the configured log level
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (config.has("log.level")) {
        set_log_level(parse_log_level(config.get<std::string>("log.level")));
    }

    return true;
}

} // namespace knowmap
