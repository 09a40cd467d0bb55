#include <tessera/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace tessera::log {

namespace {

struct LevelInfo {
    Level level;
    const char* name;
    const char* color;
};

constexpr LevelInfo kLevels[] = {
    {Trace, "trace", "\033[90m"},
    {Debug, "debug", "\033[36m"},
    {Info,  "info",  "\033[32m"},
    {Warn,  "warn",  "\033[33m"},
    {Error, "error", "\033[31m"},
};

constexpr const char* kReset = "\033[0m";

// Resolution and digest calls log from several threads at once.
std::atomic<int> s_level{Info};
std::once_flag s_color_detect;
std::atomic<bool> s_color_enabled{false};
std::mutex s_write_mutex;

const LevelInfo& info_for(Level lvl) {
    for (const auto& li : kLevels) {
        if (li.level == lvl) return li;
    }
    return kLevels[0];
}

void detect_color() {
    std::call_once(s_color_detect, [] {
        s_color_enabled.store(isatty(fileno(stderr)) != 0);
    });
}

// Formats the whole line first so it reaches stderr in one write.
void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < get_level()) return;
    detect_color();

    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed < 0) return;

    std::string body(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(&body[0], body.size(), fmt, args);
    body.resize(static_cast<size_t>(needed));

    const LevelInfo& li = info_for(lvl);
    std::string line;
    if (s_color_enabled.load()) {
        line = std::string(li.color) + li.name + kReset + ": ";
    } else {
        line = std::string(li.name) + ": ";
    }
    line += body;
    line += '\n';

    std::lock_guard<std::mutex> lock(s_write_mutex);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace

void set_level(Level lvl) { s_level.store(lvl); }
Level get_level() { return static_cast<Level>(s_level.load()); }

void set_color_enabled(bool enabled) {
    // An explicit setting wins over terminal detection.
    detect_color();
    s_color_enabled.store(enabled);
}

bool is_color_enabled() {
    detect_color();
    return s_color_enabled.load();
}

const char* level_name(Level lvl) { return info_for(lvl).name; }

bool parse_level(const std::string& name, Level& out) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "warning") lower = "warn";
    for (const auto& li : kLevels) {
        if (lower == li.name) {
            out = li.level;
            return true;
        }
    }
    return false;
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace tessera::log
