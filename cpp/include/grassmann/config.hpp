#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace grassmann {

/**
 * Ambient settings shared by every solver call in the process.
 *
 * Values come from the environment (GRASSMANN_LOG_LEVEL, GRASSMANN_LOG_FILE,
 * GRASSMANN_NUM_THREADS) and optionally from a key=value file. The solver
 * loads the environment on first use; an explicit load() or init_config()
 * beforehand takes its place. Environment variables override values set
 * with set(); unset variables leave them alone. Algorithm constants are
 * absent: they are fixed in the solver.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            load_from_file(config_file);
        }

        loaded_ = true;
        return validate();
    }

    /**
     * Load the environment unless a load already happened since the last
     * reset(). Returns true when this call did the loading; valid then
     * reports the validation result.
     */
    bool ensure_loaded(bool& valid) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loaded_) return false;

        load_from_env();
        loaded_ = true;
        valid = validate();
        return true;
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

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
        loaded_ = false;
    }

    /**
     * Push log.level / log.file into the Logger.
     *
     * A log.file different from the one currently open replaces it; the
     * Logger is pointed at the new stream before the old one is closed.
     * An empty log.file leaves the current output alone.
     */
    void apply_logging() {
        std::string level;
        std::string log_file;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            level = get_unlocked<std::string>("log.level", "warn");
            log_file = get_unlocked<std::string>("log.file", "");
        }

        set_log_level(parse_log_level(level));

        if (log_file.empty()) return;

        std::lock_guard<std::mutex> lock(log_file_mutex_);
        if (log_stream_ && log_file == log_path_) {
            set_log_output(*log_stream_);
            return;
        }

        auto stream = std::make_unique<std::ofstream>(log_file, std::ios::app);
        if (!stream->is_open()) {
            LOG_ERROR("Could not open log file: ", log_file);
            return;
        }

        set_log_output(*stream);
        log_stream_ = std::move(stream);
        log_path_ = log_file;
    }

    static LogLevel parse_log_level(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::WARN;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
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
        set_if_env("log.level", "GRASSMANN_LOG_LEVEL", "warn");
        set_if_env("log.file", "GRASSMANN_LOG_FILE", "");
        set_if_env("perf.num_threads", "GRASSMANN_NUM_THREADS", "1");
    }

    void set_if_env(const std::string& key, const char* env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
            s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) continue;

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

        std::string log_level = get_unlocked<std::string>("log.level", "warn");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" && log_level != "error") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'warn'");
            values_["log.level"] = "warn";
        }

        int threads = get_unlocked<int>("perf.num_threads", 1);
        if (threads < 0) {
            LOG_ERROR("Invalid thread count: ", threads);
            values_["perf.num_threads"] = "1";
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
    bool loaded_ = false;

    std::mutex log_file_mutex_;
    std::unique_ptr<std::ofstream> log_stream_;
    std::string log_path_;
};

// Load the environment into Config and apply the log settings
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();
    bool ok = config.load(config_file);
    config.apply_logging();
    if (!ok) {
        LOG_ERROR("Configuration contained invalid values; defaults were substituted");
    }
    return ok;
}

// First-use hook for the solver: load the environment once per reset()
inline void ensure_config() {
    Config& config = Config::getInstance();
    bool valid = true;
    if (config.ensure_loaded(valid)) {
        config.apply_logging();
        if (!valid) {
            LOG_ERROR("Configuration contained invalid values; defaults were substituted");
        }
    }
}

} // namespace grassmann
