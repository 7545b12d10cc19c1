#pragma once

#include <genid/container/vector.hh>
#include <genid/support/integral.hh>
#include <genid/support/optional.hh>
#include <genid/support/string.hh>
#include <genid/support/string_view.hh>

#include <stdint.h>

namespace genid {

enum class ArgsParseResult {
    Continue,
    ExitFailure,
    ExitSuccess,
};

/**
 * @brief Command line parser for flags, string and integer options, and a list of positional arguments.
 *
 * Options take the forms --name, --name=value, --name value, -n value and -nvalue. Every destination is owned by the
 * caller and must outlive parse_args. --help and --version are always recognised.
 */
class ArgsParser {
    // Exactly one destination is set.
    struct Option {
        String long_name;
        String help;
        char short_name;
        bool *flag;
        String *text;
        uint64_t *number;

        bool takes_value() const { return flag == nullptr; }
    };

    String m_name;
    String m_description;
    String m_version;
    Vector<Option> m_options;
    Vector<String> *m_positional{nullptr};
    String m_positional_name;
    bool m_positional_required{false};
    bool m_help_requested{false};
    bool m_version_requested{false};

    const Option *find_long(StringView name) const;
    const Option *find_short(char name) const;
    ArgsParseResult store(const Option &option, StringView program, StringView value) const;
    void print_help(StringView program) const;

public:
    /**
     * @brief Parses an integer in decimal, or in hexadecimal if prefixed with 0x.
     */
    template <Integral T>
    static Optional<T> parse_integral(StringView text) {
        if (text.starts_with("0x") || text.starts_with("0X")) {
            return text.substr(2).to_integral<T>(16);
        }
        return text.to_integral<T>();
    }

    ArgsParser(String name, String description, String version);
    ArgsParser(const ArgsParser &) = delete;
    ArgsParser(ArgsParser &&) = delete;
    ~ArgsParser() = default;

    ArgsParser &operator=(const ArgsParser &) = delete;
    ArgsParser &operator=(ArgsParser &&) = delete;

    void add_flag(bool &present, String help, String long_name, char short_name = '\0');
    void add_option(String &value, String help, String long_name, char short_name = '\0');
    void add_option(uint64_t &value, String help, String long_name, char short_name = '\0');
    void add_arguments(Vector<String> &values, String name, bool required);
    ArgsParseResult parse_args(int argc, const char *const *argv);
};

} // namespace genid
