/**
 * @file test_parse.cpp
 * @brief Unit tests for PESEL parsing and validation.
 */

#include <pesel/codec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace pesel;

TEST_CASE("Parse reference number", "[parse]") {
    auto result = parse("44051401458");
    REQUIRE(result.ok());
    REQUIRE(result.error() == ParseError::Ok);

    const Pesel& p = result.value();
    REQUIRE(p.to_string() == "44051401458");
    REQUIRE(p.year() == 1944);
    REQUIRE(p.month() == 5);
    REQUIRE(p.day() == 14);
    REQUIRE(p.sex() == Sex::Male);
}

TEST_CASE("Parse numbers from every century", "[parse]") {
    struct Case {
        const char* digits;
        int year;
        int month;
        int day;
        Sex sex;
    };

    const Case cases[] = {
        {"00810100019", 1800, 1, 1, Sex::Male},
        {"99923100014", 1899, 12, 31, Sex::Male},
        {"00010100008", 1900, 1, 1, Sex::Female},
        {"99123100010", 1999, 12, 31, Sex::Male},
        {"00210100004", 2000, 1, 1, Sex::Female},
        {"00222900016", 2000, 2, 29, Sex::Male},
        {"00430100019", 2100, 3, 1, Sex::Male},
        {"00661500008", 2200, 6, 15, Sex::Female},
        {"99723100001", 2299, 12, 31, Sex::Female},
    };

    for (const auto& c : cases) {
        INFO(c.digits);
        auto result = parse(c.digits);
        REQUIRE(result.ok());
        REQUIRE(result->year() == c.year);
        REQUIRE(result->month() == c.month);
        REQUIRE(result->day() == c.day);
        REQUIRE(result->sex() == c.sex);
    }
}

TEST_CASE("Parse rejects wrong length", "[parse]") {
    SECTION("empty") {
        REQUIRE(parse("").error() == ParseError::InvalidLength);
    }

    SECTION("too short") {
        REQUIRE(parse("4405140145").error() == ParseError::InvalidLength);
    }

    SECTION("too long") {
        REQUIRE(parse("440514014580").error() == ParseError::InvalidLength);
    }

    SECTION("length is checked before content") {
        REQUIRE(parse("abc").error() == ParseError::InvalidLength);
        REQUIRE(parse("4405-14-01458").error() == ParseError::InvalidLength);
    }

    SECTION("failed result holds no value") {
        auto result = parse("123");
        REQUIRE_FALSE(result.ok());
        REQUIRE_FALSE(static_cast<bool>(result));
    }
}

TEST_CASE("Parse rejects non-digit characters", "[parse]") {
    REQUIRE(parse("4405140145a").error() == ParseError::NonDigitCharacter);
    REQUIRE(parse("a4051401458").error() == ParseError::NonDigitCharacter);
    REQUIRE(parse("44051 01458").error() == ParseError::NonDigitCharacter);
    REQUIRE(parse("4405-401458").error() == ParseError::NonDigitCharacter);
    REQUIRE(parse("+4051401458").error() == ParseError::NonDigitCharacter);

    SECTION("embedded NUL") {
        std::string text = "44051401458";
        text[5] = '\0';
        REQUIRE(parse(text).error() == ParseError::NonDigitCharacter);
    }

    SECTION("non-ASCII byte") {
        std::string text = "44051401458";
        text[3] = static_cast<char>(0xB5);
        REQUIRE(parse(text).error() == ParseError::NonDigitCharacter);
    }

    SECTION("digit check comes before month check") {
        REQUIRE(parse("44951201x58").error() == ParseError::NonDigitCharacter);
    }
}

TEST_CASE("Parse rejects month fields outside every century", "[parse]") {
    // Month field 95 lies between buckets
    REQUIRE(parse("44951201458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44001401458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44131401458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44331401458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44531401458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44731401458").error() == ParseError::InvalidMonth);
    REQUIRE(parse("44931401458").error() == ParseError::InvalidMonth);
}

TEST_CASE("Parse rejects impossible dates", "[parse]") {
    SECTION("day out of range") {
        REQUIRE(parse("44053201458").error() == ParseError::InvalidDate);
        REQUIRE(parse("44050001458").error() == ParseError::InvalidDate);
        REQUIRE(parse("44059901458").error() == ParseError::InvalidDate);
    }

    // The numbers below carry a correct check digit, so only the date fails.
    SECTION("31st of April") {
        REQUIRE(parse("90043100009").error() == ParseError::InvalidDate);
    }

    SECTION("30th of February") {
        REQUIRE(parse("90023000000").error() == ParseError::InvalidDate);
    }

    SECTION("29th of February in a non-leap year") {
        REQUIRE(parse("90022900004").error() == ParseError::InvalidDate);
        // 1900 is a century year not divisible by 400
        REQUIRE(parse("00022900003").error() == ParseError::InvalidDate);
    }

    SECTION("29th of February in a leap year") {
        auto result = parse("00222900009");
        REQUIRE(result.ok());
        REQUIRE(result->year() == 2000);
        REQUIRE(result->month() == 2);
        REQUIRE(result->day() == 29);
    }

    SECTION("day 00") {
        REQUIRE(parse("89040000009").error() == ParseError::InvalidDate);
    }
}

TEST_CASE("Parse rejects checksum mismatch", "[parse]") {
    REQUIRE(parse("44051401459").error() == ParseError::ChecksumMismatch);
    REQUIRE(parse("44051401450").error() == ParseError::ChecksumMismatch);
    REQUIRE(parse("80052600015").error() == ParseError::ChecksumMismatch);
}

TEST_CASE("Sex follows the parity of the tenth digit", "[parse]") {
    REQUIRE(parse("80052600014")->sex() == Sex::Male);
    REQUIRE(parse("80052600007")->sex() == Sex::Female);
    REQUIRE(parse("80052612316")->sex() == Sex::Male);
}

TEST_CASE("is_valid predicate", "[parse]") {
    REQUIRE(is_valid("44051401458"));
    REQUIRE_FALSE(is_valid("44051401459"));
    REQUIRE_FALSE(is_valid(""));
    REQUIRE_FALSE(is_valid("4405140145a"));
}
