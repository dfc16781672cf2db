#include <folio/log.hpp>

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <mutex>

#include <unistd.h>

namespace folio::log {

namespace {

std::atomic<Level> g_level{Info};
std::atomic<bool> g_color{false};
std::once_flag g_color_once;

// Guards g_out and every write to it
std::mutex g_out_mutex;
std::FILE* g_out = nullptr;

thread_local std::string t_tag;

void detect_color() {
    std::call_once(g_color_once, [] { g_color = isatty(fileno(stderr)) != 0; });
}

const char* color_of(Level lvl) {
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
    if (lvl < g_level.load()) return;
    detect_color();

    char body[2048];
    std::vsnprintf(body, sizeof(body), fmt, args);

    std::string tag;
    if (!t_tag.empty()) tag = "[" + t_tag + "] ";

    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::FILE* out = g_out ? g_out : stderr;
    bool color = g_color.load() && isatty(fileno(out));
    if (color) {
        std::fprintf(out, "%s%s\033[0m: %s%s\n", color_of(lvl), level_name(lvl),
                     tag.c_str(), body);
    } else {
        std::fprintf(out, "%s: %s%s\n", level_name(lvl), tag.c_str(), body);
    }
    std::fflush(out);
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level get_level() { return g_level; }

void set_color_enabled(bool enabled) {
    detect_color();
    g_color = enabled;
}

bool is_color_enabled() {
    detect_color();
    return g_color;
}

void set_output(std::FILE* out) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    g_out = out;
}

void set_thread_tag(const std::string& tag) { t_tag = tag; }
const std::string& thread_tag() { return t_tag; }

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

bool parse_level(const std::string& name, Level& out) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    static const struct { const char* name; Level level; } names[] = {
        {"trace", Trace}, {"debug", Debug}, {"info", Info},
        {"warn", Warn}, {"warning", Warn}, {"error", Error},
    };
    for (const auto& n : names) {
        if (lower == n.name) {
            out = n.level;
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

} // namespace folio::log
