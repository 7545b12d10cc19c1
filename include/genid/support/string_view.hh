#pragma once

#include <genid/support/assert.hh>
#include <genid/support/integral.hh>
#include <genid/support/optional.hh>

#include <stddef.h>

namespace genid {

class StringView {
    const char *m_data{""};
    size_t m_length{0};

public:
    constexpr StringView() = default;
    constexpr StringView(const char *data, size_t length) : m_data(data), m_length(length) {}
    constexpr StringView(const char *c_string) : m_data(c_string), m_length(__builtin_strlen(c_string)) {}

    constexpr StringView substr(size_t offset, size_t length = static_cast<size_t>(-1)) const {
        GENID_ASSERT(offset <= m_length);
        return {m_data + offset, genid::min(length, m_length - offset)};
    }
    constexpr bool starts_with(StringView prefix) const {
        return prefix.m_length <= m_length && substr(0, prefix.m_length) == prefix;
    }

    /**
     * @brief Parses the whole view as an integer in the given base (2 to 16).
     *
     * A leading '-' is accepted for signed types only.
     * @return the value, or nullopt on an empty view, a stray character, or overflow of T
     */
    template <Integral T>
    constexpr Optional<T> to_integral(unsigned base = 10) const;

    constexpr const char *begin() const { return m_data; }
    constexpr const char *end() const { return m_data + m_length; }
    constexpr const char *data() const { return m_data; }
    constexpr char operator[](size_t index) const { return m_data[index]; }
    constexpr bool empty() const { return m_length == 0; }
    constexpr size_t length() const { return m_length; }

    friend constexpr bool operator==(StringView lhs, StringView rhs) {
        if (lhs.m_length != rhs.m_length) {
            return false;
        }
        for (size_t i = 0; i < lhs.m_length; i++) {
            if (lhs.m_data[i] != rhs.m_data[i]) {
                return false;
            }
        }
        return true;
    }
};

template <Integral T>
constexpr Optional<T> StringView::to_integral(unsigned base) const {
    GENID_ASSERT(base >= 2 && base <= 16);
    StringView digits = *this;
    bool negative = false;
    if constexpr (is_signed<T>) {
        if (digits.starts_with("-")) {
            negative = true;
            digits = digits.substr(1);
        }
    }
    if (digits.empty()) {
        return genid::nullopt;
    }

    // Accumulate towards the sign so that the most negative value doesn't overflow.
    T value = 0;
    for (char ch : digits) {
        unsigned digit = 16;
        if (ch >= '0' && ch <= '9') {
            digit = static_cast<unsigned>(ch - '0');
        } else if ((ch | 0x20) >= 'a' && (ch | 0x20) <= 'f') {
            digit = static_cast<unsigned>((ch | 0x20) - 'a') + 10;
        }
        if (digit >= base || __builtin_mul_overflow(value, static_cast<T>(base), &value)) {
            return genid::nullopt;
        }
        const bool overflowed = negative ? __builtin_sub_overflow(value, static_cast<T>(digit), &value)
                                         : __builtin_add_overflow(value, static_cast<T>(digit), &value);
        if (overflowed) {
            return genid::nullopt;
        }
    }
    return value;
}

} // namespace genid
