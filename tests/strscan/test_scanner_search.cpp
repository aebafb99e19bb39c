#include <catch2/catch_test_macros.hpp>
#include "strscan/Scanner.hpp"

using namespace strscan;

namespace {
const std::string kWord = R"([\p{L}\p{N}_]+)";
} // namespace

TEST_CASE("Scanner - ScanUntil returns everything up to the match end", "[scanner][search]") {
    Scanner scanner("tør bøf.");

    REQUIRE(scanner.ScanUntil("bø") == "tør bø");
    REQUIRE(scanner.Position() == 6);
    REQUIRE(scanner.MatchedString() == "bø");
    REQUIRE(scanner.PreMatch().value() + "bø" == "tør bø");
    REQUIRE(scanner.PostMatch() == "f.");

    REQUIRE_FALSE(scanner.ScanUntil("XYZ").has_value());
    REQUIRE(scanner.Position() == 6);
    REQUIRE_FALSE(scanner.Matched());

    REQUIRE(scanner.ScanUntil(kWord) == "f");
    REQUIRE(scanner.Position() == 7);

    REQUIRE_FALSE(scanner.ScanUntil(kWord).has_value());
    REQUIRE(scanner.Position() == 7);
}

TEST_CASE("Scanner - SkipUntil returns the distance advanced", "[scanner][search]") {
    Scanner scanner("tør bøf");

    REQUIRE(scanner.SkipUntil("r") == 3);
    REQUIRE(scanner.Position() == 3);
    REQUIRE(scanner.SkipUntil("b") == 2);
    REQUIRE(scanner.Position() == 5);
    REQUIRE_FALSE(scanner.SkipUntil("x").has_value());
    REQUIRE(scanner.Position() == 5);
}

TEST_CASE("Scanner - CheckUntil looks ahead without moving", "[scanner][search]") {
    Scanner scanner("tør bøf");

    REQUIRE(scanner.CheckUntil("r") == "tør");
    REQUIRE(scanner.Position() == 0);
    REQUIRE(scanner.CheckUntil("b") == "tør b");
    REQUIRE(scanner.Position() == 0);
    REQUIRE(scanner.MatchedString() == "b");
    REQUIRE_FALSE(scanner.CheckUntil("x").has_value());
    REQUIRE_FALSE(scanner.Matched());
}

TEST_CASE("Scanner - Exist measures the distance to the match end", "[scanner][search]") {
    Scanner scanner("test string");

    REQUIRE(scanner.Exist("s") == 3);
    REQUIRE(scanner.Exist("r") == 8);
    REQUIRE(scanner.Position() == 0);
    REQUIRE_FALSE(scanner.Exist("x").has_value());

    scanner.SetPosition(4);
    REQUIRE(scanner.Exist("s") == 2);
}

TEST_CASE("Scanner - search starts at the cursor", "[scanner][search]") {
    SECTION("Match directly at the cursor") {
        Scanner scanner("abc");
        REQUIRE(scanner.ScanUntil("a") == "a");
        REQUIRE(scanner.LastMatch()->start == 0);
        REQUIRE(scanner.PreMatch() == "");
    }

    SECTION("Earlier occurrences are ignored") {
        Scanner scanner("xxabc");
        scanner.SetPosition(1);
        REQUIRE(scanner.CheckUntil("x") == "x");
        REQUIRE(scanner.LastMatch()->start == 1);
    }

    SECTION("Leftmost match wins") {
        Scanner scanner("a1 b22 c333");
        REQUIRE(scanner.ScanUntil(R"(\d+)") == "a1");
        REQUIRE(scanner.ScanUntil(R"(\d+)") == " b22");
        REQUIRE(scanner.ScanUntil(R"(\d+)") == " c333");
        REQUIRE(scanner.AtEndOfString());
    }

    SECTION("Word boundary uses the text before the cursor") {
        Scanner scanner("foobar bar");
        scanner.SetPosition(3);
        REQUIRE(scanner.ScanUntil(R"(\bbar)") == "bar bar");
        REQUIRE(scanner.LastMatch()->start == 7);
    }
}

TEST_CASE("Scanner - search-ahead transforms", "[scanner][search][transform]") {
    Scanner scanner("key=value; other=thing");
    const std::string pair = R"((?P<key>\w+)=(?P<value>\w+))";

    auto swap = [](const CaptureLookup& group) { return *group("value") + "=" + *group("key"); };

    REQUIRE(scanner.CheckUntil(pair, swap) == "value=key");
    REQUIRE(scanner.Position() == 0);

    scanner.SetPosition(9);
    REQUIRE(scanner.ScanUntil(pair, swap) == "thing=other");
    REQUIRE(scanner.AtEndOfString());
}
