#pragma once

#include <genid/support/assert.hh>
#include <genid/support/utility.hh>

namespace genid {

struct nullopt_t {
    explicit constexpr nullopt_t(int) {}
};
inline constexpr nullopt_t nullopt(0);

/**
 * @brief Either a T or nothing. Restricted to trivially copyable T so that it stays a literal type.
 */
template <typename T>
class Optional {
    static_assert(is_trivially_copyable<T>);

    union {
        char m_none;
        T m_value;
    };
    bool m_present;

public:
    constexpr Optional() : m_none(0), m_present(false) {}
    constexpr Optional(nullopt_t) : Optional() {}
    constexpr Optional(const T &value) : m_value(value), m_present(true) {}

    constexpr explicit operator bool() const { return m_present; }
    constexpr bool has_value() const { return m_present; }

    constexpr T value_or(const T &fallback) const { return m_present ? m_value : fallback; }
    constexpr void emplace(const T &value) { *this = Optional(value); }
    constexpr void clear() { *this = Optional(); }

    constexpr const T &operator*() const {
        GENID_ASSERT(m_present);
        return m_value;
    }
    constexpr const T *operator->() const {
        GENID_ASSERT(m_present);
        return &m_value;
    }
};

} // namespace genid
