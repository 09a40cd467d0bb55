#include <catch2/catch.hpp>
#include <tessera/config.hpp>
#include <tessera/content_store.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace tessera;

// ===== Parsing =====

TEST_CASE("parse config with glob section", "[config]") {
    auto r = Config::parse(R"(
[glob]
match-error-behavior = "error"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().match_error_behavior == GlobMatchErrorBehavior::Error);
}

TEST_CASE("parse config with store and log sections", "[config]") {
    auto r = Config::parse(R"(
[store]
path = "/var/cache/tessera/blobs.db"

[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().store_path == std::string("/var/cache/tessera/blobs.db"));
    REQUIRE(r.value().log_level == log::Level::Debug);
    REQUIRE(r.value().log_color == false);
    REQUIRE_FALSE(r.value().match_error_behavior.has_value());
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().match_error_behavior.has_value());
    REQUIRE_FALSE(r.value().store_path.has_value());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().log_color.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::Parse);
}

TEST_CASE("parse rejects bad values", "[config]") {
    auto behavior = Config::parse("[glob]\nmatch-error-behavior = \"sometimes\"\n");
    REQUIRE(behavior.is_err());
    REQUIRE(behavior.error().code == TesseraError::Config);

    auto not_string = Config::parse("[glob]\nmatch-error-behavior = 3\n");
    REQUIRE(not_string.is_err());
    REQUIRE(not_string.error().code == TesseraError::Config);

    auto level = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == TesseraError::Config);

    auto color = Config::parse("[log]\ncolor = \"yes\"\n");
    REQUIRE(color.is_err());
    REQUIRE(color.error().code == TesseraError::Config);

    auto path = Config::parse("[store]\npath = \"\"\n");
    REQUIRE(path.is_err());
    REQUIRE(path.error().code == TesseraError::Config);
}

TEST_CASE("parse behavior names ignore case", "[config]") {
    auto r = Config::parse("[glob]\nmatch-error-behavior = \"IGNORE\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().match_error_behavior == GlobMatchErrorBehavior::Ignore);
}

// ===== Loading =====

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/tessera/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::IO);
}

TEST_CASE("load records the file on parse errors", "[config]") {
    std::string path = "/tmp/tessera_test_config_" + std::to_string(getpid()) + ".toml";
    {
        std::ofstream f(path);
        f << "[log]\nlevel = \"shouting\"\n";
    }
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);

    {
        std::ofstream f(path);
        f << "[store]\npath = \"/tmp/blobs.db\"\n";
    }
    auto ok = Config::load(path);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().effective_store_path() == "/tmp/blobs.db");
    fs::remove(path);
}

// ===== Layering =====

TEST_CASE("merge overrides only keys that are set", "[config]") {
    Config base;
    base.match_error_behavior = GlobMatchErrorBehavior::Warn;
    base.store_path = "/global/blobs.db";
    base.log_level = log::Level::Info;

    Config overlay;
    overlay.match_error_behavior = GlobMatchErrorBehavior::Error;

    base.merge(overlay);
    REQUIRE(base.match_error_behavior == GlobMatchErrorBehavior::Error);
    REQUIRE(base.store_path == std::string("/global/blobs.db"));
    REQUIRE(base.log_level == log::Level::Info);
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[glob]
match-error-behavior = "ignore"
[store]
path = "/global/blobs.db"
[log]
level = "warn"
)");
    auto project = Config::parse(R"(
[log]
level = "trace"
)");
    REQUIRE(global.is_ok());
    REQUIRE(project.is_ok());

    auto eff = Config::effective(global.value(), project.value());
    REQUIRE(eff.match_error_behavior == GlobMatchErrorBehavior::Ignore);
    REQUIRE(eff.store_path == std::string("/global/blobs.db"));
    REQUIRE(eff.log_level == log::Level::Trace);
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE_FALSE(eff.match_error_behavior.has_value());
    REQUIRE(eff.effective_store_path() == SqliteContentStore::default_store_path());
}

// ===== Applying =====

TEST_CASE("apply installs log settings", "[config]") {
    auto saved_level = log::get_level();
    auto saved_color = log::is_color_enabled();

    Config cfg;
    cfg.log_level = log::Level::Error;
    cfg.log_color = false;
    REQUIRE(cfg.apply().is_ok());
    REQUIRE(log::get_level() == log::Level::Error);
    REQUIRE_FALSE(log::is_color_enabled());

    log::set_level(saved_level);
    log::set_color_enabled(saved_color);
}

TEST_CASE("apply cannot change glob defaults once they are in use", "[config]") {
    // Reading the process defaults freezes them.
    auto current = GlobDefaults::process().match_error_behavior;

    Config cfg;
    cfg.match_error_behavior = GlobMatchErrorBehavior::Ignore;
    auto r = cfg.apply();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TesseraError::Config);
    REQUIRE(GlobDefaults::process().match_error_behavior == current);
}

TEST_CASE("global config path contains .tessera", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".tessera/config.toml") != std::string::npos);
    }
}
