#pragma once

#include <genid/support/string_builder.hh>
#include <genid/support/string_view.hh>

#include <stdint.h>

namespace genid {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
};

/**
 * @brief Writes one line to the log (stderr), prefixed with the elapsed time and the level.
 */
void log_line(LogLevel level, StringView message);
void open_log();
void close_log();

bool log_colours_enabled();
void set_log_colours_enabled(bool enabled);

// Milliseconds since the first call into the log.
uint64_t log_elapsed_ms();

// Plain program output on stdout, never decorated.
void print(StringView text);
void println(StringView text);

template <typename... Args>
void print(StringView fmt, const Args &...args) {
    print(genid::format(fmt, args...).view());
}
template <typename... Args>
void println(StringView fmt, const Args &...args) {
    println(genid::format(fmt, args...).view());
}

template <typename... Args>
void trace(StringView fmt, const Args &...args) {
    log_line(LogLevel::Trace, genid::format(fmt, args...).view());
}
template <typename... Args>
void debug(StringView fmt, const Args &...args) {
    log_line(LogLevel::Debug, genid::format(fmt, args...).view());
}
template <typename... Args>
void info(StringView fmt, const Args &...args) {
    log_line(LogLevel::Info, genid::format(fmt, args...).view());
}
template <typename... Args>
void warn(StringView fmt, const Args &...args) {
    log_line(LogLevel::Warn, genid::format(fmt, args...).view());
}
template <typename... Args>
void error(StringView fmt, const Args &...args) {
    log_line(LogLevel::Error, genid::format(fmt, args...).view());
}

} // namespace genid
