#pragma once

namespace genid {

/**
 * @brief Logs the message as an error, flushes the log and aborts.
 */
[[noreturn]] void fatal_error(const char *message);

} // namespace genid

#define GENID_STRINGIFY_IMPL(x) #x
#define GENID_STRINGIFY(x) GENID_STRINGIFY_IMPL(x)

// Checked in every build.
#define GENID_ENSURE(expr)                                                                                             \
    do {                                                                                                               \
        if (!static_cast<bool>(expr)) [[unlikely]] {                                                                   \
            genid::fatal_error(__FILE__ ":" GENID_STRINGIFY(__LINE__) ": check '" #expr "' failed");                   \
        }                                                                                                              \
    } while (false)
#define GENID_ENSURE_NOT_REACHED() genid::fatal_error(__FILE__ ":" GENID_STRINGIFY(__LINE__) ": unreachable")

// Checked only in builds without NDEBUG.
#ifdef NDEBUG
#define GENID_ASSERT(expr) static_cast<void>(0)
#else
#define GENID_ASSERT(expr) GENID_ENSURE(expr)
#endif
