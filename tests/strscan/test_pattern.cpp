#include <catch2/catch_test_macros.hpp>
#include "strscan/Pattern.hpp"
#include "strscan/ScannerErrors.hpp"
#include "strscan/Scanner.hpp"

using namespace strscan;

TEST_CASE("Pattern - FromString compiles", "[pattern]") {
    SECTION("Literal") {
        auto pattern = Pattern::FromString("bø");
        REQUIRE(pattern.Source() == "bø");
        REQUIRE(pattern.GroupCount() == 0);
        REQUIRE(pattern.NamedGroups().empty());
    }

    SECTION("Positional groups") {
        auto pattern = Pattern::FromString(R"((\w+) (\w+) (\d+))");
        REQUIRE(pattern.GroupCount() == 3);
        REQUIRE(pattern.GroupNames().empty());
    }

    SECTION("Named groups are numbered too") {
        auto pattern = Pattern::FromString(R"((?P<date>(?P<day>\w+) (?P<month>\w+) (?P<year>\d+)))");
        REQUIRE(pattern.GroupCount() == 4);
        REQUIRE(pattern.NamedGroups().at("date") == 1);
        REQUIRE(pattern.NamedGroups().at("day") == 2);
        REQUIRE(pattern.NamedGroups().at("month") == 3);
        REQUIRE(pattern.NamedGroups().at("year") == 4);
        REQUIRE(pattern.GroupNames().at(4) == "year");
    }
}

TEST_CASE("Pattern - invalid source", "[pattern][error]") {
    REQUIRE_THROWS_AS(Pattern::FromString("(unclosed"), InvalidPatternError);
    REQUIRE_THROWS_AS(Pattern::FromString("a{2,1}"), InvalidPatternError);

    try {
        Pattern::FromString("[z-a]");
        FAIL("expected InvalidPatternError");
    } catch (const InvalidPatternError& ex) {
        REQUIRE(ex.source() == "[z-a]");
        REQUIRE_FALSE(ex.diagnostic().empty());
    }
}

TEST_CASE("Pattern - copies share the compiled program", "[pattern]") {
    auto pattern = Pattern::FromString("abc");
    Pattern copy = pattern;
    REQUIRE(&copy.Program() == &pattern.Program());
}

TEST_CASE("Pattern - options change matching", "[pattern][options]") {
    SECTION("Case insensitive") {
        PatternOptions options;
        options.case_sensitive = false;
        Scanner scanner("HELLO world");
        REQUIRE(scanner.Scan(Pattern::FromString("hello", options)) == "HELLO");
        REQUIRE_FALSE(scanner.Scan(Pattern::FromString(" WORLD")).has_value());
    }

    SECTION("Leftmost-longest") {
        PatternOptions options;
        options.longest_match = true;
        Scanner scanner("abcd");
        REQUIRE(scanner.Check(Pattern::FromString("a|ab|abc")) == "a");
        REQUIRE(scanner.Check(Pattern::FromString("a|ab|abc", options)) == "abc");
    }

    SECTION("Dot matches newline") {
        PatternOptions options;
        options.dot_nl = true;
        Scanner scanner("a\nb");
        REQUIRE_FALSE(scanner.Check(Pattern::FromString("a.b")).has_value());
        REQUIRE(scanner.Check(Pattern::FromString("a.b", options)) == "a\nb");
    }
}

TEST_CASE("Pattern - shorthand classes are ASCII-only", "[pattern][unicode]") {
    Scanner scanner("tør 42٣ x");

    REQUIRE(scanner.Check(R"(\w+)") == "t");
    REQUIRE(scanner.Scan(R"(\p{L}+)") == "tør");
    REQUIRE(scanner.Skip(R"(\s+)") == 1);

    REQUIRE(scanner.Check(R"(\d+)") == "42");
    REQUIRE(scanner.Scan(R"(\p{N}+)") == "42٣");
    REQUIRE(scanner.Position() == 7);
}
