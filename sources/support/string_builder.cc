#include <genid/support/string_builder.hh>

#include <genid/support/string_view.hh>

#include <stdint.h>

namespace genid {

StringBuilder::Spec StringBuilder::parse_spec(StringView text) {
    Spec spec;
    if (!text.empty()) {
        spec.radix = text[0];
    }
    if (text.length() >= 2 && text[1] >= '1' && text[1] <= '9') {
        spec.width = static_cast<uint8_t>(text[1] - '0');
    }
    if (text.length() >= 3) {
        spec.fill = text[2];
    }
    return spec;
}

void StringBuilder::write_unsigned(widest_uint_t value, Spec spec) {
    if (spec.radix == 'c') {
        m_chars.push(static_cast<char>(value));
        return;
    }

    const unsigned base = spec.radix == 'h' ? 16 : 10;
    // 39 digits covers a 128-bit value in decimal.
    char digits[40];
    uint8_t count = 0;
    do {
        digits[count++] = "0123456789abcdef"[static_cast<unsigned>(value % base)];
        value /= base;
    } while (value != 0);

    if (base == 16) {
        write(StringView("0x"));
    }
    for (uint8_t padding = count; padding < spec.width; padding++) {
        m_chars.push(spec.fill);
    }
    while (count > 0) {
        m_chars.push(digits[--count]);
    }
}

} // namespace genid
