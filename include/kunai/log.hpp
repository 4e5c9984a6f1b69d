#pragma once

#include <optional>
#include <string>

namespace kunai::log {

// Off suppresses everything; it is a threshold, never a message level
enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Returns the name string for a level
const char* level_name(Level lvl);

// "off", "trace", "debug", "info", "warn", "error" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

// While alive, every message is prefixed with "<source>: " so the output of a
// batch run can be attributed. Scopes nest; the innermost name is used.
class SourceScope {
public:
    explicit SourceScope(std::string source);
    ~SourceScope();

    SourceScope(const SourceScope&) = delete;
    SourceScope& operator=(const SourceScope&) = delete;

private:
    std::string previous_;
};

// Name of the innermost live SourceScope, or "" outside any scope
const std::string& current_source();

} // namespace kunai::log
