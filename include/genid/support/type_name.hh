#pragma once

#include <genid/support/string_view.hh>

#include <stddef.h>

namespace genid {

// The compiler spells T out in __PRETTY_FUNCTION__ as "[T = name]" (clang) or "[with T = name]" (gcc).
template <typename T>
consteval StringView type_name() {
    constexpr StringView signature(__PRETTY_FUNCTION__);
    constexpr StringView marker("T = ");
    for (size_t start = 0; start + marker.length() <= signature.length(); start++) {
        if (signature.substr(start, marker.length()) != marker) {
            continue;
        }
        const size_t first = start + marker.length();
        size_t last = first;
        while (last < signature.length() && signature[last] != ']' && signature[last] != ';') {
            last++;
        }
        return signature.substr(first, last - first);
    }
    return "unknown type";
}

} // namespace genid
