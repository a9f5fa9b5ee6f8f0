#pragma once

#include <sqlid/log.hpp>
#include <sqlid/result.hpp>
#include <string>
#include <vector>

namespace sqlid {

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// TOML configuration for logging and the name checker:
//
//   [log]
//   level = "debug"
//   color = false
//
//   [names]
//   check = ["Users", "order items"]
struct Config {
    LogConfig logging;
    std::vector<std::string> names;
    // Track which log fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top: its explicitly-set fields win, names append
    void merge(const Config& other);

    // Push level and color into sqlid::log. Color is left on auto-detect
    // unless the config set it.
    void apply_logging() const;
};

} // namespace sqlid
