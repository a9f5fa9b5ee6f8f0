#include <sqlid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace sqlid {

// Config error positioned at the offending TOML node
static SqlidError config_error(const toml::node& node, std::string msg) {
    SqlidError err{SqlidError::Config, std::move(msg)};
    err.line = static_cast<int>(node.source().begin.line);
    err.column = static_cast<int>(node.source().begin.column);
    return err;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        SqlidError err{SqlidError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        err.column = static_cast<int>(e.source().begin.column);
        return err;
    }

    Config cfg;

    // [log] section
    if (auto node = doc.get("log")) {
        auto lg = node->as_table();
        if (!lg) {
            return config_error(*node, "log must be a table");
        }
        if (auto level = lg->get("level")) {
            auto name = level->value<std::string>();
            if (!name) {
                return config_error(*level, "log.level must be a string");
            }
            auto lvl = log::level_from_name(*name);
            if (!lvl) {
                auto err = config_error(*level, "unknown log level '" + *name + "'");
                err.hint = "expected one of: trace, debug, info, warn, error";
                return err;
            }
            cfg.logging.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto color = lg->get("color")) {
            auto v = color->as_boolean();
            if (!v) {
                return config_error(*color, "log.color must be true or false");
            }
            cfg.logging.color = v->get();
            cfg.log_color_set = true;
        }
    }

    // [names] section
    if (auto node = doc.get("names")) {
        auto names = node->as_table();
        if (!names) {
            return config_error(*node, "names must be a table");
        }
        if (auto check_node = names->get("check")) {
            auto check = check_node->as_array();
            if (!check) {
                auto err = config_error(*check_node, "names.check must be an array of strings");
                err.hint = "write check = [\"name\", ...]";
                return err;
            }
            for (const auto& el : *check) {
                if (!el.is_string()) {
                    return config_error(el, "names.check entries must be strings");
                }
                cfg.names.push_back(*el.value<std::string>());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SqlidError{SqlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    names.insert(names.end(), other.names.begin(), other.names.end());
}

void Config::apply_logging() const {
    log::set_level(logging.level);
    if (log_color_set) {
        log::set_color_enabled(logging.color);
    }
}

} // namespace sqlid
