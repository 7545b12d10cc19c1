#include <genid/support/string.hh>
#include <genid/support/string_builder.hh>
#include <genid/support/string_view.hh>
#include <genid/test/assertions.hh>
#include <genid/test/matchers.hh>
#include <genid/test/test.hh>

#include <stdint.h>

using namespace genid;
using namespace genid::test::matchers;

namespace {

struct Named {
    String to_string() const { return "named"; }
};

} // namespace

TEST_CASE(StringBuilder, Plain) {
    StringBuilder sb;
    EXPECT_TRUE(sb.empty());
    sb.append("hello");
    sb.append(' ');
    sb.append("{}", "world");
    EXPECT_THAT(sb.length(), is(equal_to(11u)));
    EXPECT_TRUE(sb.build().view() == "hello world");
}

TEST_CASE(StringBuilder, Integers) {
    EXPECT_TRUE(genid::format("{} {}", 0, 42u).view() == "0 42");
    EXPECT_TRUE(genid::format("{}", -17).view() == "-17");
    EXPECT_TRUE(genid::format("{}", int64_t(-0x7fffffffffffffff - 1)).view() == "-9223372036854775808");
    EXPECT_TRUE(genid::format("{}", uint64_t(0xffffffffffffffffu)).view() == "18446744073709551615");
}

TEST_CASE(StringBuilder, Hex) {
    EXPECT_TRUE(genid::format("{h}", 255u).view() == "0xff");
    EXPECT_TRUE(genid::format("{h8}", 42u).view() == "0x0000002a");
    EXPECT_TRUE(genid::format("{h}", uint64_t(0xfffffffe00000000u)).view() == "0xfffffffe00000000");
}

TEST_CASE(StringBuilder, Padding) {
    EXPECT_TRUE(genid::format("{d5 }", 12u).view() == "   12");
    EXPECT_TRUE(genid::format("{d3}", 7u).view() == "007");
    EXPECT_TRUE(genid::format("{d3}", 12345u).view() == "12345");
}

TEST_CASE(StringBuilder, Mixed) {
    String name("entity");
    EXPECT_TRUE(genid::format("{}={} ok={}", name, 3, true).view() == "entity=3 ok=true");
    EXPECT_TRUE(genid::format("<{}>", Named{}).view() == "<named>");
    EXPECT_TRUE(genid::format("{c}{c}", 'o', 'k').view() == "ok");
}

TEST_CASE(StringBuilder, MissingArguments) {
    EXPECT_TRUE(genid::format("a {} b", 1).view() == "a 1 b");
    EXPECT_TRUE(genid::format("trailing {}").view() == "trailing {}");
}

