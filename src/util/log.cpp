#include <adocref/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace adocref::log {

// Resolver calls log from concurrent readers
static std::atomic<Level> s_level{Warn};
static std::atomic<bool> s_color_initialized{false};
static std::atomic<bool> s_color_enabled{false};

static void init_color() {
    bool expected = false;
    if (!s_color_initialized.load(std::memory_order_acquire)) {
        bool tty = isatty(fileno(stderr)) != 0;
        if (s_color_initialized.compare_exchange_strong(expected, true)) {
            s_color_enabled.store(tty);
        }
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled.store(enabled);
    s_color_initialized.store(true, std::memory_order_release);
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled.load();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return RefError{RefError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   return "";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    Level threshold = s_level.load(std::memory_order_relaxed);
    if (lvl < threshold || threshold == Off) return;
    init_color();

    va_list sized;
    va_copy(sized, args);
    int n = std::vsnprintf(nullptr, 0, fmt, sized);
    va_end(sized);
    std::string body(n > 0 ? static_cast<size_t>(n) : 0, '\0');
    if (n > 0) std::vsnprintf(&body[0], body.size() + 1, fmt, args);

    // One write per line so concurrent messages do not interleave
    if (s_color_enabled.load()) {
        std::fprintf(stderr, "%sadocref %s\033[0m: %s\n",
                     level_color(lvl), level_name(lvl), body.c_str());
    } else {
        std::fprintf(stderr, "adocref %s: %s\n", level_name(lvl), body.c_str());
    }
}

#define ADOCREF_LOG_FN(name, lvl)        \
    void name(const char* fmt, ...) {    \
        va_list args;                    \
        va_start(args, fmt);             \
        log_message(lvl, fmt, args);     \
        va_end(args);                    \
    }

ADOCREF_LOG_FN(trace, Trace)
ADOCREF_LOG_FN(debug, Debug)
ADOCREF_LOG_FN(info, Info)
ADOCREF_LOG_FN(warn, Warn)
ADOCREF_LOG_FN(error, Error)

#undef ADOCREF_LOG_FN

} // namespace adocref::log
