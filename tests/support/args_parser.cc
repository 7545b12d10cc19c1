#include <genid/container/vector.hh>
#include <genid/support/args_parser.hh>
#include <genid/support/string.hh>
#include <genid/test/assertions.hh>
#include <genid/test/matchers.hh>
#include <genid/test/test.hh>

#include <stdint.h>

using namespace genid;
using namespace genid::test::matchers;

namespace {

template <int N>
ArgsParseResult parse(ArgsParser &parser, const char *const (&argv)[N]) {
    return parser.parse_args(N, argv);
}

} // namespace

TEST_CASE(ArgsParser, ParseIntegral) {
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("1234"), is(equal_to(1234u)));
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("0xff"), is(equal_to(255u)));
    EXPECT_THAT(ArgsParser::parse_integral<uint64_t>("0XFFFFFFFE00000000"), is(equal_to(uint64_t(0xfffffffe00000000u))));
    EXPECT_THAT(ArgsParser::parse_integral<int32_t>("-12"), is(equal_to(-12)));
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("0x"), is(null()));
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("12a"), is(null()));
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("4294967296"), is(null()));
    EXPECT_THAT(ArgsParser::parse_integral<uint32_t>("-1"), is(null()));
}

TEST_CASE(ArgsParser, FlagsAndOptions) {
    bool colour = false;
    bool quiet = false;
    uint64_t index = 0;
    String name;
    ArgsParser parser("test", "Test", "1.0");
    parser.add_flag(colour, "Colour", "colour");
    parser.add_flag(quiet, "Quiet", "quiet", 'q');
    parser.add_option(index, "Index", "index", 'i');
    parser.add_option(name, "Name", "name");

    const char *const argv[]{"test", "--colour", "--index", "0x10", "--name=entity"};
    EXPECT_THAT(parse(parser, argv), is(equal_to(ArgsParseResult::Continue)));
    EXPECT_TRUE(colour);
    EXPECT_FALSE(quiet);
    EXPECT_THAT(index, is(equal_to(uint64_t(16))));
    EXPECT_TRUE(name.view() == "entity");
}

TEST_CASE(ArgsParser, ShortOptions) {
    bool quiet = false;
    uint64_t index = 0;
    uint64_t generation = 0;
    ArgsParser parser("test", "Test", "1.0");
    parser.add_flag(quiet, "Quiet", "quiet", 'q');
    parser.add_option(index, "Index", "index", 'i');
    parser.add_option(generation, "Generation", "generation", 'g');

    const char *const argv[]{"test", "-q", "-i42", "-g", "7"};
    EXPECT_THAT(parse(parser, argv), is(equal_to(ArgsParseResult::Continue)));
    EXPECT_TRUE(quiet);
    EXPECT_THAT(index, is(equal_to(uint64_t(42))));
    EXPECT_THAT(generation, is(equal_to(uint64_t(7))));
}

TEST_CASE(ArgsParser, Positional) {
    bool quiet = false;
    Vector<String> inputs;
    ArgsParser parser("test", "Test", "1.0");
    parser.add_flag(quiet, "Quiet", "quiet", 'q');
    parser.add_arguments(inputs, "input", true);

    const char *const argv[]{"test", "a", "-q", "b", "--", "-c", "-"};
    EXPECT_THAT(parse(parser, argv), is(equal_to(ArgsParseResult::Continue)));
    EXPECT_TRUE(quiet);
    ASSERT_THAT(inputs.size(), is(equal_to(4u)));
    EXPECT_TRUE(inputs[0].view() == "a");
    EXPECT_TRUE(inputs[1].view() == "b");
    EXPECT_TRUE(inputs[2].view() == "-c");
    EXPECT_TRUE(inputs[3].view() == "-");
}

TEST_CASE(ArgsParser, HelpAndVersion) {
    ArgsParser parser("test", "Test", "1.0");
    const char *const help[]{"test", "-h"};
    EXPECT_THAT(parse(parser, help), is(equal_to(ArgsParseResult::ExitSuccess)));

    ArgsParser other("test", "Test", "1.0");
    const char *const version[]{"test", "--version"};
    EXPECT_THAT(parse(other, version), is(equal_to(ArgsParseResult::ExitSuccess)));
}

TEST_CASE(ArgsParser, Failures) {
    const auto fails = [](auto &&argv) {
        Vector<String> inputs;
        bool quiet = false;
        uint64_t index = 0;
        ArgsParser parser("test", "Test", "1.0");
        parser.add_arguments(inputs, "input", true);
        parser.add_flag(quiet, "Quiet", "quiet", 'q');
        parser.add_option(index, "Index", "index", 'i');
        return parse(parser, argv) == ArgsParseResult::ExitFailure;
    };

    const char *const unknown[]{"test", "--bogus", "a"};
    EXPECT_TRUE(fails(unknown));
    const char *const unknown_short[]{"test", "-x", "a"};
    EXPECT_TRUE(fails(unknown_short));
    const char *const missing_input[]{"test", "-q"};
    EXPECT_TRUE(fails(missing_input));
    const char *const not_integer[]{"test", "--index", "seven", "a"};
    EXPECT_TRUE(fails(not_integer));
    const char *const negative[]{"test", "--index=-1", "a"};
    EXPECT_TRUE(fails(negative));
    const char *const no_value[]{"test", "a", "--index"};
    EXPECT_TRUE(fails(no_value));
    const char *const flag_with_value[]{"test", "--quiet=yes", "a"};
    EXPECT_TRUE(fails(flag_with_value));
}

TEST_CASE(ArgsParser, UnexpectedPositional) {
    bool quiet = false;
    ArgsParser parser("test", "Test", "1.0");
    parser.add_flag(quiet, "Quiet", "quiet", 'q');
    const char *const argv[]{"test", "stray"};
    EXPECT_THAT(parse(parser, argv), is(equal_to(ArgsParseResult::ExitFailure)));
}
