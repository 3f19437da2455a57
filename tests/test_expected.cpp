#include "catch2_custom.hpp"

#include <exegrader/common/error_types.hpp>
#include <exegrader/common/expected.hpp>

#include <string>
#include <system_error>

using namespace std::literals;
using exegrader::ErrorKind;
using exegrader::Expected;
using exegrader::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Result<int> parse_digit(char chr) {
    if (chr < '0' || chr > '9') {
        return ErrorKind::IoFailure;
    }
    return chr - '0';
}

Result<int> sum_digits(char lhs, char rhs) {
    int lhs_val = TRY(parse_digit(lhs));
    int rhs_val = TRYE(parse_digit(rhs), UnknownError);

    return lhs_val + rhs_val;
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
    REQUIRE(Et{"Hello"}.error() == "Hello");
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});
    REQUIRE(Et{123} != Et{"123"});

    // Comparison against a plain value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234"s);

    REQUIRE(Et{"Unexpected!"} == "Unexpected!"s);
    REQUIRE(Et{"Unexpected!"} != "Exp!"s);
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(123) == 123);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{12}.transform(square) == 144);
    REQUIRE(Et{"no"}.transform(square) == "no"s);
}

TEST_CASE("TRY and TRYE propagate errors") {
    REQUIRE(sum_digits('4', '5') == 9);
    REQUIRE(sum_digits('x', '5') == ErrorKind::IoFailure);
    REQUIRE(sum_digits('4', 'x') == ErrorKind::UnknownError);
}

TEST_CASE("Syscall-style results hold error codes") {
    Expected<int> res = std::make_error_code(std::errc::no_such_file_or_directory);

    REQUIRE(res.has_error());
    REQUIRE(res.error() == std::errc::no_such_file_or_directory);
}
