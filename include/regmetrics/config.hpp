#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "regmetrics/error.hpp"
#include "regmetrics/logging.hpp"

namespace regmetrics {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Environment first, then the optional key=value file on top of it.
    // Throws ConfigError when the merged values are unusable.
    void load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::map<std::string, std::string> sorted(values_.begin(), values_.end());
        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : sorted) {
            LOG_INFO("  ", key, " = ", key == "db.password" && !value.empty() ? "****" : value);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
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
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
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
        set_if_env("input.dir", "REGM_INPUT_DIR", "bulk");
        set_if_env("store.dir", "REGM_STORE_DIR", "json_cfr");

        set_if_env("ingest.workers", "REGM_WORKERS", "0");  // 0 = hardware concurrency
        set_if_env("ingest.write_retries", "REGM_WRITE_RETRIES", "2");

        set_if_env("history.workers", "REGM_HISTORY_WORKERS", "2");
        set_if_env("history.snapshot", "REGM_HISTORY_SNAPSHOT", "true");

        set_if_env("log.level", "REGM_LOG_LEVEL", "info");
        set_if_env("log.file", "REGM_LOG_FILE", "");

        set_if_env("db.host", "REGM_DB_HOST", "localhost");
        set_if_env("db.port", "REGM_DB_PORT", "5432");
        set_if_env("db.user", "REGM_DB_USER", "postgres");
        set_if_env("db.password", "REGM_DB_PASS", "");
        set_if_env("db.name", "REGM_DB_NAME", "regmetrics");
    }

    void set_if_env(const std::string& key, const char* env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
        auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    void validate() {
        int workers = get_unlocked<int>("ingest.workers", 0);
        if (workers < 0) {
            throw ConfigError("ingest.workers must be >= 0, got " + std::to_string(workers),
                              "use 0 to size the pool from the hardware concurrency");
        }

        int retries = get_unlocked<int>("ingest.write_retries", 2);
        if (retries < 0) {
            throw ConfigError("ingest.write_retries must be >= 0, got " + std::to_string(retries));
        }

        int history_workers = get_unlocked<int>("history.workers", 2);
        if (history_workers < 1) {
            throw ConfigError("history.workers must be >= 1, got " + std::to_string(history_workers));
        }

        int port = get_unlocked<int>("db.port", 5432);
        if (port <= 0 || port > 65535) {
            throw ConfigError("Invalid database port: " + std::to_string(port));
        }

        LogLevel level;
        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (!parse_log_level(log_level, level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Loads the configuration and applies the logging keys. Throws ConfigError.
inline void init_config(const std::string& config_file = "regmetrics.env") {
    Config& config = Config::getInstance();
    config.load(config_file);

    LogLevel level = LogLevel::INFO;
    parse_log_level(config.get<std::string>("log.level", "info"), level);
    set_log_level(level);

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }
}

} // namespace regmetrics
