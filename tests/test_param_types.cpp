#include <doctest/doctest.h>
#include "zebralink/param_types.hpp"

#include <stdexcept>

using namespace zebralink;

TEST_CASE("integer_between accepts the inclusive range only") {
    auto t = integer_between(1, 10);
    CHECK_FALSE(t->validate(1).has_value());
    CHECK_FALSE(t->validate(10).has_value());
    CHECK(t->validate(0).value() == "should be an integer between 1 and 10");
    CHECK(t->validate(11).value() == "should be an integer between 1 and 10");
}

TEST_CASE("integer_between is strict about kind: numeric strings are rejected") {
    auto t = integer_between(0, 100);
    CHECK(t->validate("5").value() == "should be a number");
    CHECK(t->validate(true).value() == "should be a number");
}

TEST_CASE("alphanumeric checks characters and length bounds") {
    auto t = alphanumeric(1, 8);
    CHECK_FALSE(t->validate("LOGO01").has_value());
    CHECK(t->validate("").value() == "should be an alphanumeric string with length between 1 and 8");
    CHECK(t->validate("TOOLONGNAME").has_value());
    CHECK(t->validate("ab-c").has_value());
    CHECK(t->validate(7).value() == "should be a string");

    auto one = alphanumeric_of_length(1);
    CHECK_FALSE(one->validate("0").has_value());
    CHECK(one->validate("AB").value() == "should be an alphanumeric string of length 1");
}

TEST_CASE("one_of lists its members in the message") {
    auto t = one_of({"N", "R", "I", "B"});
    CHECK_FALSE(t->validate("R").has_value());
    CHECK(t->validate("X").value() == "should be one of N, R, I, B");
    CHECK(t->validate(1).has_value());
}

TEST_CASE("boolean tokens take flags and render tokens") {
    auto t = yes_no();
    CHECK_FALSE(t->validate(true).has_value());
    CHECK_FALSE(t->validate(false).has_value());
    CHECK(t->validate("Y").value() == "should be a boolean value");

    auto po = std::dynamic_pointer_cast<const BooleanTokens>(boolean_tokens("I", "N"));
    REQUIRE(po);
    CHECK(po->token(true) == "I");
    CHECK(po->token(false) == "N");
}

TEST_CASE("kind checks for text, number and binary") {
    CHECK_FALSE(text()->validate("abc").has_value());
    CHECK(text()->validate(5).value() == "should be of type string");
    CHECK(number()->validate("5").value() == "should be of type number");
    CHECK_FALSE(binary()->validate(Bytes{0x00, 0xFF}).has_value());
    CHECK(binary()->validate("00ff").value() == "should be a byte sequence");
}

TEST_CASE("matching uses an ECMAScript search") {
    auto t = matching("^[0-9]+$");
    CHECK_FALSE(t->validate("0123").has_value());
    CHECK(t->validate("12a").value() == "should match ^[0-9]+$");
    CHECK(t->validate(12).value() == "should be a string");
}

TEST_CASE("any_of passes when one member passes and joins all failures otherwise") {
    auto t = any_of({integer_between(1, 14), one_of({"A", "B", "C", "D", "E"})});
    CHECK_FALSE(t->validate(3).has_value());
    CHECK_FALSE(t->validate("E").has_value());
    CHECK(t->validate(20).value() == "should be an integer between 1 and 14, or should be one of A, B, C, D, E");
}

TEST_CASE("misconfigured types throw at construction") {
    CHECK_THROWS_AS(integer_between(5, 1), std::invalid_argument);
    CHECK_THROWS_AS(alphanumeric(3, 1), std::invalid_argument);
    CHECK_THROWS_AS(matching("("), std::invalid_argument);
    CHECK_THROWS_AS(boolean_tokens("Y", "Y"), std::invalid_argument);
    CHECK_THROWS_AS(any_of({}), std::invalid_argument);
    CHECK_THROWS_AS(any_of({ParamTypePtr{}}), std::invalid_argument);
}
