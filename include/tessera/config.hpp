#pragma once

#include <tessera/log.hpp>
#include <tessera/path_globs.hpp>
#include <tessera/result.hpp>
#include <optional>
#include <string>

namespace tessera {

// Layered configuration: global, then project. A later layer overrides
// only the keys it sets.
//
//   [glob]
//   match-error-behavior = "warn"    # ignore | warn | error
//   [store]
//   path = "/var/cache/tessera/blobs.db"
//   [log]
//   level = "info"
//   color = true
struct Config {
    std::optional<GlobMatchErrorBehavior> match_error_behavior;
    std::optional<std::string> store_path;
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Store path, falling back to SqliteContentStore::default_store_path()
    std::string effective_store_path() const;

    // Install log settings, and the process-wide glob defaults when the
    // config names a match error behavior.
    Status apply() const;
};

// Discover the global config file path: ~/.tessera/config.toml
std::string global_config_path();

} // namespace tessera
