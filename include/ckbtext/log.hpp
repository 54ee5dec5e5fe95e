#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ckbtext::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Unnamed messages: "warn: ..."
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// A named source of messages, printed as "debug[math]: ...". Every
// normalization pass logs through a channel named after the pass, the
// pipeline through "pipeline".
class Channel {
public:
    explicit Channel(const char* name) : name_(name) {}

    const char* name() const { return name_; }

    // Level threshold passed and the channel not filtered out
    bool enabled(Level lvl) const;

    void trace(const char* fmt, ...) const;
    void debug(const char* fmt, ...) const;
    void info(const char* fmt, ...) const;
    void warn(const char* fmt, ...) const;
    void error(const char* fmt, ...) const;

private:
    const char* name_;
};

// Only the listed channels are printed; an empty list prints all of them.
// Unnamed messages are never filtered.
void set_channels(const std::vector<std::string>& names);
const std::vector<std::string>& get_channels();

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses "trace".."error" (case-sensitive); nullopt for anything else
std::optional<Level> parse_level(const std::string& name);

// Applies a "level" or "level:channel,channel" setting, the format of the
// CKBTEXT_LOG variable. Leaves the state untouched and returns false when
// the level is not recognized.
bool configure(const std::string& setting);

} // namespace ckbtext::log
