#include <tessera/config.hpp>
#include <tessera/content_store.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace tessera {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TesseraError{TesseraError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [glob] section
    if (auto glob = doc["glob"].as_table()) {
        if (auto node = (*glob)["match-error-behavior"]) {
            auto s = node.value<std::string>();
            if (!s) {
                return TesseraError{TesseraError::Config,
                    "glob.match-error-behavior must be a string"};
            }
            TESSERA_TRY_ASSIGN(auto behavior, parse_match_error_behavior(*s));
            cfg.match_error_behavior = behavior;
        }
    }

    // [store] section
    if (auto store = doc["store"].as_table()) {
        if (auto node = (*store)["path"]) {
            auto s = node.value<std::string>();
            if (!s || s->empty()) {
                return TesseraError{TesseraError::Config,
                    "store.path must be a non-empty string"};
            }
            cfg.store_path = *s;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            log::Level lvl;
            if (!s || !log::parse_level(*s, lvl)) {
                return TesseraError{TesseraError::Config,
                    "log.level must be one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = lvl;
        }
        if (auto node = (*lg)["color"]) {
            auto b = node.value<bool>();
            if (!b) {
                return TesseraError{TesseraError::Config, "log.color must be a boolean"};
            }
            cfg.log_color = *b;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TesseraError{TesseraError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_file(path);
}

void Config::merge(const Config& other) {
    if (other.match_error_behavior) match_error_behavior = other.match_error_behavior;
    if (other.store_path) store_path = other.store_path;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string Config::effective_store_path() const {
    return store_path.value_or(SqliteContentStore::default_store_path());
}

Status Config::apply() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
    if (match_error_behavior) {
        GlobDefaults defaults;
        defaults.match_error_behavior = *match_error_behavior;
        TESSERA_TRY(GlobDefaults::configure(defaults));
    }
    return ok_status();
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tessera/config.toml";
}

} // namespace tessera
