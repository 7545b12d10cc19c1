#include <genid/core/log.hh>

#include <genid/support/assert.hh>
#include <genid/support/string_builder.hh>
#include <genid/support/string_view.hh>
#include <genid/support/utility.hh>

#include <pthread.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>

namespace genid {
namespace {

uint64_t now_ms() {
    timespec now{};
    clock_gettime(CLOCK_MONOTONIC, &now);
    return static_cast<uint64_t>(now.tv_sec) * 1000u + static_cast<uint64_t>(now.tv_nsec) / 1000000u;
}

GENID_GLOBAL(pthread_mutex_t s_output_lock = PTHREAD_MUTEX_INITIALIZER);
GENID_GLOBAL(const uint64_t s_epoch_ms = now_ms());
GENID_GLOBAL(bool s_colours = false);

void write_locked(FILE *stream, StringView text, bool newline) {
    pthread_mutex_lock(&s_output_lock);
    fwrite(text.data(), 1, text.length(), stream);
    if (newline) {
        fputc('\n', stream);
    }
    pthread_mutex_unlock(&s_output_lock);
}

struct LevelStyle {
    const char *tag;
    const char *colour;
};

LevelStyle level_style(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return {"TRACE", "\x1b[35m"};
    case LogLevel::Debug:
        return {"DEBUG", "\x1b[36m"};
    case LogLevel::Info:
        return {"INFO ", "\x1b[32m"};
    case LogLevel::Warn:
        return {"WARN ", "\x1b[1;33m"};
    case LogLevel::Error:
        return {"ERROR", "\x1b[1;31m"};
    }
    return {"?????", ""};
}

} // namespace

bool log_colours_enabled() {
    return s_colours;
}

void set_log_colours_enabled(bool enabled) {
    s_colours = enabled;
}

uint64_t log_elapsed_ms() {
    return now_ms() - s_epoch_ms;
}

void log_line(LogLevel level, StringView message) {
    const auto style = level_style(level);
    const uint64_t elapsed = log_elapsed_ms();
    StringBuilder sb;
    if (s_colours) {
        sb.append("\x1b[37m[{d5 }.{d3}]\x1b[0m {}{}\x1b[0m {}", elapsed / 1000, elapsed % 1000, style.colour, style.tag,
                  message);
    } else {
        sb.append("[{d5 }.{d3}] {} {}", elapsed / 1000, elapsed % 1000, style.tag, message);
    }
    write_locked(stderr, sb.build().view(), true);
}

void open_log() {
    // Keep program output ordered with log lines when stdout is a pipe.
    setvbuf(stdout, nullptr, _IOLBF, 0);
}

void close_log() {
    pthread_mutex_lock(&s_output_lock);
    fflush(stdout);
    fflush(stderr);
    pthread_mutex_unlock(&s_output_lock);
}

void print(StringView text) {
    write_locked(stdout, text, false);
}

void println(StringView text) {
    write_locked(stdout, text, true);
}

void fatal_error(const char *message) {
    log_line(LogLevel::Error, message);
    close_log();
    abort();
}

} // namespace genid
