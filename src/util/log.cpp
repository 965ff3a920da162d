#include <pinion/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdlib>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace pinion::log {

namespace {

// Hash collection logs from worker threads
std::atomic<Level> g_level{Info};
std::atomic<int> g_color{-1};           // -1: not decided yet
std::atomic<std::FILE*> g_sink{nullptr};
std::mutex g_write_mu;

std::FILE* sink() {
    std::FILE* s = g_sink.load();
    return s ? s : stderr;
}

bool color_on() {
    int c = g_color.load();
    if (c < 0) {
        c = isatty(fileno(sink())) ? 1 : 0;
        int unset = -1;
        if (!g_color.compare_exchange_strong(unset, c)) c = unset;
    }
    return c == 1;
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    bool color = color_on();

    std::lock_guard<std::mutex> guard(g_write_mu);
    std::FILE* out = sink();
    if (color) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

} // anonymous namespace

void set_level(Level lvl) { g_level = lvl; }
Level get_level() { return g_level; }
bool enabled(Level lvl) { return lvl >= g_level.load(); }

void set_color_enabled(bool enabled) { g_color = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

void set_sink(std::FILE* s) { g_sink = s; }

Status init_from_env() {
    if (std::getenv("NO_COLOR")) set_color_enabled(false);

    const char* level = std::getenv("PINION_LOG");
    if (!level || !*level) return ok_status();
    auto parsed = parse_level(level);
    if (parsed.is_err()) {
        return std::move(parsed).error().prefix("PINION_LOG");
    }
    set_level(parsed.value());
    return ok_status();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return PinionError{PinionError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

#define PINION_LOG_AT(lvl)          \
    va_list args;                   \
    va_start(args, fmt);            \
    emit(lvl, fmt, args);           \
    va_end(args)

void trace(const char* fmt, ...) { PINION_LOG_AT(Trace); }
void debug(const char* fmt, ...) { PINION_LOG_AT(Debug); }
void info(const char* fmt, ...)  { PINION_LOG_AT(Info); }
void warn(const char* fmt, ...)  { PINION_LOG_AT(Warn); }
void error(const char* fmt, ...) { PINION_LOG_AT(Error); }

#undef PINION_LOG_AT

} // namespace pinion::log
