// demo_snapshot.cpp
//
// Snapshot a directory and print what was captured. Run it with:
//
//     ./demo_snapshot <root> <include>... [--exclude <filespec>]...
//                     [--ignore|--warn|--error] [--store <db>] [--contents]
//
// Configuration is read from ~/.tessera/config.toml, then <root>/.tessera.toml.

#include <tessera/config.hpp>
#include <tessera/content_store.hpp>
#include <tessera/engine.hpp>
#include <tessera/log.hpp>
#include <tessera/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tessera;

struct Options {
    std::string root;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    std::optional<GlobMatchErrorBehavior> behavior;
    std::optional<std::string> store_path;
    bool show_contents = false;
};

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--exclude" || arg == "--store") {
            if (i + 1 >= argc) {
                return TesseraError{TesseraError::InvalidArg, arg + " needs a value"};
            }
            if (arg == "--exclude") opts.exclude.push_back(argv[++i]);
            else opts.store_path = argv[++i];
        } else if (arg == "--ignore") {
            opts.behavior = GlobMatchErrorBehavior::Ignore;
        } else if (arg == "--warn") {
            opts.behavior = GlobMatchErrorBehavior::Warn;
        } else if (arg == "--error") {
            opts.behavior = GlobMatchErrorBehavior::Error;
        } else if (arg == "--contents") {
            opts.show_contents = true;
        } else if (opts.root.empty()) {
            opts.root = arg;
        } else {
            opts.include.push_back(arg);
        }
    }
    if (opts.root.empty() || opts.include.empty()) {
        return TesseraError{TesseraError::InvalidArg,
            "no root or include filespec given",
            "usage: demo_snapshot <root> <include>... [--exclude <filespec>]..."};
    }
    return Result<Options>::ok(std::move(opts));
}

static Result<Config> load_config(const std::string& root) {
    std::optional<Config> global;
    std::optional<Config> project;

    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        TESSERA_TRY_ASSIGN(global, Config::load(global_path));
    }
    fs::path project_path = fs::path(root) / ".tessera.toml";
    if (fs::exists(project_path)) {
        TESSERA_TRY_ASSIGN(project, Config::load(project_path.string()));
    }
    return Result<Config>::ok(Config::effective(global, project));
}

static Status run(int argc, char** argv) {
    TESSERA_TRY_ASSIGN(auto opts, parse_args(argc, argv));
    TESSERA_TRY_ASSIGN(auto config, load_config(opts.root));
    TESSERA_TRY(config.apply());

    SqliteContentStore store;
    TESSERA_TRY(store.open(opts.store_path.value_or(config.effective_store_path())));

    SnapshotEngine engine(store);
    PathGlobsAndRoot request{PathGlobs(opts.include, opts.exclude, opts.behavior), opts.root};
    TESSERA_TRY_ASSIGN(auto snapshot, engine.snapshot(request));

    std::cout << snapshot.digest().fingerprint.hex()
              << " " << snapshot.digest().serialized_bytes_length << "\n";
    for (const auto& ps : snapshot.path_stats()) {
        if (auto* file = std::get_if<FileStat>(&ps.stat)) {
            std::cout << "  file " << ps.path << " (" << file->size << " bytes"
                      << (file->is_executable ? ", executable" : "") << ")\n";
        } else {
            std::cout << "  dir  " << ps.path << "\n";
        }
    }

    if (opts.show_contents) {
        TESSERA_TRY_ASSIGN(auto contents, engine.files_content(snapshot));
        for (const auto& fc : contents) {
            std::cout << "--- " << fc.path << "\n" << fc.content;
            if (!fc.content.empty() && fc.content.back() != '\n') std::cout << "\n";
        }
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
