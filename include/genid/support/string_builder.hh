#pragma once

#include <genid/container/vector.hh>
#include <genid/support/integral.hh>
#include <genid/support/string.hh>
#include <genid/support/string_view.hh>
#include <genid/support/utility.hh>

#include <stdint.h>

namespace genid {

template <typename T>
concept HasToString = requires(const T &object) { object.to_string(); };

/**
 * @brief Accumulates formatted text.
 *
 * Each {} in a format string is replaced by the next argument. Between the braces an optional spec selects how an
 * integer is written: 'h' for 0x-prefixed hex, 'c' for a raw character, or 'd' for decimal, followed by an optional
 * minimum width digit and fill character, e.g. {d5 } or {h8}. Surplus placeholders are copied through unchanged.
 */
class StringBuilder {
    struct Spec {
        char radix{'d'};
        uint8_t width{0};
        char fill{'0'};
    };

    Vector<char> m_chars;

    void write(StringView text) { m_chars.extend(text); }
    void write(const String &text) { write(text.view()); }
    void write(const char *text) { write(StringView(text)); }
    void write(bool value) { write(StringView(value ? "true" : "false")); }
    void write_unsigned(widest_uint_t value, Spec spec);

    template <Integral T>
    void write_integer(T value, Spec spec) {
        if constexpr (is_signed<T>) {
            if (value < 0 && spec.radix != 'c') {
                m_chars.push('-');
                write_unsigned(widest_uint_t(0) - static_cast<widest_uint_t>(value), spec);
                return;
            }
        }
        write_unsigned(static_cast<widest_uint_t>(value), spec);
    }

    template <typename T>
    void write_argument(const T &value, Spec spec) {
        if constexpr (Integral<T> && !is_same<T, bool>) {
            write_integer(value, spec);
        } else if constexpr (HasToString<T>) {
            write(value.to_string());
        } else {
            write(value);
        }
    }

    static Spec parse_spec(StringView text);

public:
    template <typename... Args>
    void append(StringView fmt, const Args &...args);
    void append(char ch) { m_chars.push(ch); }

    String build() const { return String(StringView(m_chars.data(), m_chars.size())); }
    bool empty() const { return m_chars.empty(); }
    uint32_t length() const { return m_chars.size(); }
};

template <typename... Args>
void StringBuilder::append(StringView fmt, const Args &...args) {
    size_t position = 0;
    auto next_placeholder = [&](const auto &arg) {
        while (position < fmt.length() && fmt[position] != '{') {
            m_chars.push(fmt[position++]);
        }
        size_t close = position;
        while (close < fmt.length() && fmt[close] != '}') {
            close++;
        }
        if (close >= fmt.length()) {
            return;
        }
        write_argument(arg, parse_spec(fmt.substr(position + 1, close - position - 1)));
        position = close + 1;
    };
    (next_placeholder(args), ...);
    write(fmt.substr(position));
}

template <typename... Args>
String format(StringView fmt, const Args &...args) {
    StringBuilder sb;
    sb.append(fmt, args...);
    return sb.build();
}

} // namespace genid
