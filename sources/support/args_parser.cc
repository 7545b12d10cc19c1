#include <genid/support/args_parser.hh>

#include <genid/container/vector.hh>
#include <genid/core/log.hh>
#include <genid/support/string.hh>
#include <genid/support/string_builder.hh>
#include <genid/support/string_view.hh>
#include <genid/support/utility.hh>

#include <stddef.h>
#include <stdint.h>

namespace genid {

ArgsParser::ArgsParser(String name, String description, String version)
    : m_name(genid::move(name)), m_description(genid::move(description)), m_version(genid::move(version)) {
    add_flag(m_help_requested, "Show this help and exit", "help", 'h');
    add_flag(m_version_requested, "Show the version and exit", "version");
}

void ArgsParser::add_flag(bool &present, String help, String long_name, char short_name) {
    m_options.push({genid::move(long_name), genid::move(help), short_name, &present, nullptr, nullptr});
}

void ArgsParser::add_option(String &value, String help, String long_name, char short_name) {
    m_options.push({genid::move(long_name), genid::move(help), short_name, nullptr, &value, nullptr});
}

void ArgsParser::add_option(uint64_t &value, String help, String long_name, char short_name) {
    m_options.push({genid::move(long_name), genid::move(help), short_name, nullptr, nullptr, &value});
}

void ArgsParser::add_arguments(Vector<String> &values, String name, bool required) {
    m_positional = &values;
    m_positional_name = genid::move(name);
    m_positional_required = required;
}

const ArgsParser::Option *ArgsParser::find_long(StringView name) const {
    for (const auto &option : m_options) {
        if (option.long_name.view() == name) {
            return &option;
        }
    }
    return nullptr;
}

const ArgsParser::Option *ArgsParser::find_short(char name) const {
    if (name == '\0') {
        return nullptr;
    }
    for (const auto &option : m_options) {
        if (option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

ArgsParseResult ArgsParser::store(const Option &option, StringView program, StringView value) const {
    if (option.text != nullptr) {
        *option.text = String(value);
        return ArgsParseResult::Continue;
    }
    auto number = parse_integral<uint64_t>(value);
    if (!number) {
        genid::println("{}: --{} expects an unsigned integer, got '{}'", program, option.long_name, value);
        return ArgsParseResult::ExitFailure;
    }
    *option.number = *number;
    return ArgsParseResult::Continue;
}

void ArgsParser::print_help(StringView program) const {
    genid::println("{} - {}", m_name, m_description);
    if (m_positional != nullptr) {
        genid::println(m_positional_required ? "usage: {} [options] <{}>..." : "usage: {} [options] [{}]...",
                       program, m_positional_name);
    } else {
        genid::println("usage: {} [options]", program);
    }
    genid::println("options:");

    constexpr uint32_t help_column = 24;
    for (const auto &option : m_options) {
        StringBuilder sb;
        sb.append(option.short_name != '\0' ? "  -{c}, " : "      ", option.short_name);
        sb.append("--{}", option.long_name);
        uint32_t width = option.long_name.length() + 2;
        if (option.takes_value()) {
            sb.append(option.number != nullptr ? " N" : " TEXT");
            width += option.number != nullptr ? 2 : 5;
        }
        for (; width < help_column; width++) {
            sb.append(' ');
        }
        sb.append(" {}", option.help);
        genid::println(sb.build().view());
    }
}

ArgsParseResult ArgsParser::parse_args(int argc, const char *const *argv) {
    const StringView program = argc > 0 ? StringView(argv[0]) : m_name.view();
    bool options_ended = false;
    for (int i = 1; i < argc; i++) {
        const StringView arg(argv[i]);
        if (options_ended || arg.length() < 2 || !arg.starts_with("-")) {
            if (m_positional == nullptr) {
                genid::println("{}: unexpected argument '{}'", program, arg);
                return ArgsParseResult::ExitFailure;
            }
            m_positional->push(String(arg));
            continue;
        }
        if (arg == "--") {
            options_ended = true;
            continue;
        }

        // Split into the option and any value attached to it.
        const Option *option = nullptr;
        StringView attached;
        bool has_attached = false;
        if (arg.starts_with("--")) {
            StringView name = arg.substr(2);
            for (size_t j = 0; j < name.length(); j++) {
                if (name[j] == '=') {
                    attached = name.substr(j + 1);
                    name = name.substr(0, j);
                    has_attached = true;
                    break;
                }
            }
            option = find_long(name);
        } else {
            option = find_short(arg[1]);
            attached = arg.substr(2);
            has_attached = !attached.empty();
        }
        if (option == nullptr) {
            genid::println("{}: unknown option '{}'", program, arg);
            return ArgsParseResult::ExitFailure;
        }

        if (!option->takes_value()) {
            if (has_attached) {
                genid::println("{}: --{} doesn't take a value", program, option->long_name);
                return ArgsParseResult::ExitFailure;
            }
            *option->flag = true;
            continue;
        }
        if (!has_attached) {
            if (i + 1 >= argc) {
                genid::println("{}: --{} requires a value", program, option->long_name);
                return ArgsParseResult::ExitFailure;
            }
            attached = argv[++i];
        }
        if (auto result = store(*option, program, attached); result != ArgsParseResult::Continue) {
            return result;
        }
    }

    if (m_help_requested) {
        print_help(program);
        return ArgsParseResult::ExitSuccess;
    }
    if (m_version_requested) {
        genid::println("{} {}", m_name, m_version);
        return ArgsParseResult::ExitSuccess;
    }
    if (m_positional_required && m_positional->empty()) {
        genid::println("{}: missing <{}>", program, m_positional_name);
        return ArgsParseResult::ExitFailure;
    }
    return ArgsParseResult::Continue;
}

} // namespace genid
