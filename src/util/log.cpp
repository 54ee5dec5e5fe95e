#include <ckbtext/log.hpp>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ckbtext::log {

namespace {

bool s_env_read = false;
Level s_level = Warn;
std::vector<std::string> s_channels;

bool s_color_initialized = false;
bool s_color_enabled = false;

// CKBTEXT_LOG is consulted once, before the first explicit setting
void read_env() {
    if (s_env_read) return;
    s_env_read = true;
    if (const char* env = std::getenv("CKBTEXT_LOG")) {
        configure(env);
    }
}

void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

const char* const kReset = "\033[0m";

bool channel_selected(const char* channel) {
    if (!channel || s_channels.empty()) return true;
    return std::find(s_channels.begin(), s_channels.end(), channel) != s_channels.end();
}

bool should_emit(Level lvl, const char* channel) {
    read_env();
    return lvl >= s_level && channel_selected(channel);
}

void emit(Level lvl, const char* channel, const char* fmt, va_list args) {
    if (!should_emit(lvl, channel)) return;
    init_color();

    const char* color = s_color_enabled ? level_color(lvl) : "";
    const char* reset = s_color_enabled ? kReset : "";
    if (channel) {
        std::fprintf(stderr, "%s%s%s[%s]: ", color, level_name(lvl), reset, channel);
    } else {
        std::fprintf(stderr, "%s%s%s: ", color, level_name(lvl), reset);
    }
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

std::vector<std::string> split_names(const std::string& csv) {
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        if (comma > start) names.push_back(csv.substr(start, comma - start));
        start = comma + 1;
    }
    return names;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

void set_level(Level lvl) {
    read_env();
    s_level = lvl;
}

Level get_level() {
    read_env();
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_channels(const std::vector<std::string>& names) {
    read_env();
    s_channels = names;
}

const std::vector<std::string>& get_channels() {
    read_env();
    return s_channels;
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

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Trace;
    if (name == "debug") return Debug;
    if (name == "info")  return Info;
    if (name == "warn")  return Warn;
    if (name == "error") return Error;
    return std::nullopt;
}

bool configure(const std::string& setting) {
    s_env_read = true;
    size_t colon = setting.find(':');
    auto lvl = parse_level(setting.substr(0, colon));
    if (!lvl) return false;
    s_level = *lvl;
    s_channels = colon == std::string::npos
        ? std::vector<std::string>()
        : split_names(setting.substr(colon + 1));
    return true;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

#define CKBTEXT_LOG_FORWARD(lvl, channel) \
    va_list args; \
    va_start(args, fmt); \
    emit(lvl, channel, fmt, args); \
    va_end(args)

void trace(const char* fmt, ...) { CKBTEXT_LOG_FORWARD(Trace, nullptr); }
void debug(const char* fmt, ...) { CKBTEXT_LOG_FORWARD(Debug, nullptr); }
void info(const char* fmt, ...)  { CKBTEXT_LOG_FORWARD(Info, nullptr); }
void warn(const char* fmt, ...)  { CKBTEXT_LOG_FORWARD(Warn, nullptr); }
void error(const char* fmt, ...) { CKBTEXT_LOG_FORWARD(Error, nullptr); }

bool Channel::enabled(Level lvl) const {
    return should_emit(lvl, name_);
}

void Channel::trace(const char* fmt, ...) const { CKBTEXT_LOG_FORWARD(Trace, name_); }
void Channel::debug(const char* fmt, ...) const { CKBTEXT_LOG_FORWARD(Debug, name_); }
void Channel::info(const char* fmt, ...) const  { CKBTEXT_LOG_FORWARD(Info, name_); }
void Channel::warn(const char* fmt, ...) const  { CKBTEXT_LOG_FORWARD(Warn, name_); }
void Channel::error(const char* fmt, ...) const { CKBTEXT_LOG_FORWARD(Error, name_); }

#undef CKBTEXT_LOG_FORWARD

} // namespace ckbtext::log
