#include <catch2/catch_test_macros.hpp>
#include "strscan/Scanner.hpp"
#include "strscan/ScannerErrors.hpp"

#include <string>
#include <vector>

using namespace strscan;

namespace {
// \w is ASCII-only; letters and digits from any script
const std::string kWord = R"([\p{L}\p{N}_]+)";
} // namespace

TEST_CASE("Scanner - Scan walks through a Unicode string", "[scanner][anchored]") {
    Scanner scanner("tør bøf");

    REQUIRE(scanner.Scan(kWord) == "tør");
    REQUIRE(scanner.Position() == 3);

    REQUIRE_FALSE(scanner.Scan(kWord).has_value());
    REQUIRE(scanner.Position() == 3);
    REQUIRE_FALSE(scanner.Matched());

    REQUIRE(scanner.Scan(R"(\s+)") == " ");
    REQUIRE(scanner.Position() == 4);

    REQUIRE(scanner.Scan("bø") == "bø");
    REQUIRE(scanner.Position() == 6);

    REQUIRE(scanner.Scan(kWord) == "f");
    REQUIRE(scanner.Position() == 7);

    REQUIRE_FALSE(scanner.Scan(kWord).has_value());
    REQUIRE(scanner.AtEndOfString());
}

TEST_CASE("Scanner - Scan only matches at the cursor", "[scanner][anchored]") {
    Scanner scanner("abc def");

    REQUIRE_FALSE(scanner.Scan("def").has_value());
    REQUIRE(scanner.Position() == 0);

    scanner.SetPosition(4);
    REQUIRE(scanner.Scan("def") == "def");
    REQUIRE(scanner.LastMatch()->start == 4);
}

TEST_CASE("Scanner - Check does not move", "[scanner][anchored]") {
    Scanner scanner("tør bøf");

    REQUIRE(scanner.Check("tør") == "tør");
    REQUIRE(scanner.Position() == 0);
    REQUIRE(scanner.MatchedString() == "tør");

    REQUIRE_FALSE(scanner.Check("bøf").has_value());
    REQUIRE(scanner.Position() == 0);
    REQUIRE_FALSE(scanner.Matched());
}

TEST_CASE("Scanner - Skip returns the consumed length", "[scanner][anchored]") {
    Scanner scanner("test string");

    REQUIRE(scanner.Skip(R"(\w+)") == 4);
    REQUIRE(scanner.Position() == 4);
    REQUIRE_FALSE(scanner.Skip(R"(\w+)").has_value());
    REQUIRE(scanner.Position() == 4);
    REQUIRE(scanner.Skip(R"(\s)") == 1);
    REQUIRE(scanner.Skip(R"(st)") == 2);
    REQUIRE(scanner.Position() == 7);

    SECTION("Lengths are in characters") {
        Scanner unicode("bøf");
        REQUIRE(unicode.Skip("bø") == 2);
        REQUIRE(unicode.BytePosition() == 3);
    }
}

TEST_CASE("Scanner - MatchLength peeks at an anchored match", "[scanner][anchored]") {
    Scanner scanner("tør bøf");

    REQUIRE(scanner.MatchLength(kWord) == 3);
    REQUIRE(scanner.Position() == 0);
    REQUIRE(scanner.Matched());
    REQUIRE_FALSE(scanner.MatchLength(R"(\s)").has_value());
    REQUIRE_FALSE(scanner.Matched());
}

TEST_CASE("Scanner - text before the cursor is context only", "[scanner][anchored]") {
    SECTION("Multi-line ^ after a newline") {
        Scanner scanner("ab\ncd");
        scanner.SetPosition(3);
        REQUIRE(scanner.Scan("(?m)^cd") == "cd");
    }

    SECTION("Multi-line ^ mid-line") {
        Scanner scanner("ab\ncd");
        scanner.SetPosition(1);
        REQUIRE_FALSE(scanner.Scan("(?m)^b").has_value());
    }

    SECTION("Start-of-text anchors refer to the whole text") {
        Scanner scanner("ab\ncd");
        scanner.SetPosition(3);
        REQUIRE_FALSE(scanner.Scan("^cd").has_value());
        REQUIRE_FALSE(scanner.Scan(R"(\Acd)").has_value());
    }

    SECTION("Multi-line flags do not relax the anchor") {
        Scanner scanner("ab\ncd");
        REQUIRE_FALSE(scanner.Scan("(?m)^cd").has_value());
        REQUIRE(scanner.Position() == 0);
    }

    SECTION("Word boundary sees the previous character") {
        Scanner scanner("foobar");
        scanner.SetPosition(3);
        REQUIRE_FALSE(scanner.Scan(R"(\bbar)").has_value());
        REQUIRE(scanner.Scan(R"(\Bbar)") == "bar");
    }
}

TEST_CASE("Scanner - empty matches", "[scanner][anchored]") {
    Scanner scanner("abc");

    REQUIRE(scanner.Scan("x*") == "");
    REQUIRE(scanner.Position() == 0);
    REQUIRE(scanner.Matched());
    REQUIRE(scanner.MatchedSize() == 0);

    scanner.Terminate();
    REQUIRE(scanner.Scan("x*") == "");
    REQUIRE(scanner.Matched());
    REQUIRE(scanner.PreMatch() == "abc");
    REQUIRE(scanner.PostMatch() == "");
}

TEST_CASE("Scanner - compiled patterns", "[scanner][anchored]") {
    auto number = Pattern::FromString(R"(\d+)");
    Scanner scanner("12 + 345");

    REQUIRE(scanner.Scan(number) == "12");
    REQUIRE(scanner.Skip(Pattern::FromString(R"(\s*\+\s*)")) == 3);
    REQUIRE(scanner.Check(number) == "345");
    REQUIRE(scanner.Scan(number) == "345");
    REQUIRE(scanner.Cache().Size() == 0);
}

TEST_CASE("Scanner - capture transforms", "[scanner][anchored][transform]") {
    const std::string date = R"((?P<day>\w+) (?P<month>\w+) (?P<year>\d+))";
    Scanner scanner("Timestamp: Fri Dec 12 1975 14:39");
    REQUIRE(scanner.Skip("Timestamp: ") == 11);

    SECTION("Scan returns the transform result and advances") {
        auto result = scanner.Scan(date, [](const CaptureLookup& group) {
            return group("month").value_or("") + "/" + group("day").value_or("");
        });
        REQUIRE(result == "Dec/Fri");
        REQUIRE(scanner.Position() == 21);
        REQUIRE(scanner.MatchedString() == "Fri Dec 12");
    }

    SECTION("Check returns the transform result in place") {
        auto result = scanner.Check(date, [](const CaptureLookup& group) { return *group("year"); });
        REQUIRE(result == "12");
        REQUIRE(scanner.Position() == 11);
    }

    SECTION("Transform is not called on failure") {
        bool called = false;
        auto result = scanner.Scan(R"((?P<x>\d+))", [&called](const CaptureLookup&) {
            called = true;
            return std::string("unused");
        });
        REQUIRE_FALSE(result.has_value());
        REQUIRE_FALSE(called);
    }

    SECTION("Unknown names throw") {
        REQUIRE_THROWS_AS(scanner.Scan(date, [](const CaptureLookup& group) { return *group("hour"); }),
                          UnknownGroupError);
    }
}

TEST_CASE("Scanner - tokenizing an expression", "[scanner][anchored]") {
    Scanner scanner("3 + 42");
    std::vector<std::string> tokens;

    while (!scanner.AtEndOfString()) {
        if (auto number = scanner.Scan(R"(\d+)"))
            tokens.push_back(*number);
        else if (auto op = scanner.Scan("[-+*]"))
            tokens.push_back(*op);
        else
            REQUIRE(scanner.Skip(R"(\s+)").has_value());
    }

    REQUIRE(tokens == std::vector<std::string>{ "3", "+", "42" });
}
