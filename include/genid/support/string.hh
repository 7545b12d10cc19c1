#pragma once

#include <genid/container/vector.hh>
#include <genid/support/string_view.hh>
#include <genid/support/utility.hh>

#include <stdint.h>

namespace genid {

/**
 * @brief An owned, immutable run of characters. Not null terminated.
 */
class String {
    Vector<char> m_chars;

public:
    String() = default;
    String(StringView view) { m_chars.extend(view); }
    String(const char *c_string) : String(StringView(c_string)) {}
    String(const String &other) : String(other.view()) {}
    String(String &&) = default;

    String &operator=(const String &) = delete;
    String &operator=(String &&) = default;

    const char *data() const { return m_chars.empty() ? "" : m_chars.data(); }
    StringView view() const { return {data(), m_chars.size()}; }
    operator StringView() const { return view(); }

    bool empty() const { return m_chars.empty(); }
    uint32_t length() const { return m_chars.size(); }
};

} // namespace genid
