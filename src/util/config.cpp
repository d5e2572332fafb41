#include <scribe/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace scribe {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScribeError{ScribeError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [parser] section
    if (auto parser = doc["parser"].as_table()) {
        if (auto v = (*parser)["load-order-errors"].value<bool>()) {
            cfg.parser.load_order_errors = *v;
            cfg.load_order_errors_set = true;
        }
        if (auto v = (*parser)["family"].value<std::string>()) {
            if (v->empty()) {
                return ScribeError{ScribeError::Config,
                    "[parser] family must not be empty"};
            }
            cfg.parser.family = *v;
            cfg.family_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto level = log::parse_level(*v);
            if (level.is_err()) return std::move(level).error();
            cfg.logging.level = level.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [builtins] section
    if (auto builtins = doc["builtins"].as_table()) {
        if (auto extra = (*builtins)["extra"].as_array()) {
            for (const auto& item : *extra) {
                if (auto s = item.value<std::string>()) {
                    cfg.extra_builtins.push_back(*s);
                } else {
                    return ScribeError{ScribeError::Config,
                        "[builtins] extra must be an array of strings"};
                }
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScribeError{ScribeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.load_order_errors_set) {
        parser.load_order_errors = other.parser.load_order_errors;
        load_order_errors_set = true;
    }
    if (other.family_set) {
        parser.family = other.parser.family;
        family_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }

    // Builtins accumulate across layers
    for (const auto& name : other.extra_builtins) {
        if (std::find(extra_builtins.begin(), extra_builtins.end(), name) ==
            extra_builtins.end()) {
            extra_builtins.push_back(name);
        }
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Config::apply_log_settings() const {
    log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.scribe/config.toml";
}

} // namespace scribe
