#pragma once

#include <scribe/log.hpp>
#include <scribe/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

struct ParserConfig {
    bool load_order_errors = true;
    std::string family = "ruby";
};

struct LogConfig {
    log::Level level = log::Warn;
    bool color = false;
};

// Layered configuration: global (~/.scribe/config.toml) then project
// (.scribe.toml). Later layers override the fields they set explicitly.
struct Config {
    ParserConfig parser;
    LogConfig logging;
    std::vector<std::string> extra_builtins;

    // Track which fields were explicitly set (for merge)
    bool load_order_errors_set = false;
    bool family_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Push [log] settings into scribe::log. Color is only enabled when set.
    void apply_log_settings() const;
};

// Discover the global config file path: ~/.scribe/config.toml
std::string global_config_path();

// Name of the per-project config file
inline constexpr const char* PROJECT_CONFIG_FILE = ".scribe.toml";

} // namespace scribe
