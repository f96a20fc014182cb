#include "shor/args.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

TEST_CASE("Plain decimal numbers parse") {
  using shor::parse_u64;
  REQUIRE(parse_u64("21") == 21u);
  REQUIRE(parse_u64("0") == 0u);
  REQUIRE(parse_u64("007") == 7u);
  REQUIRE(parse_u64("18446744073709551615") == 18446744073709551615ull);
}

TEST_CASE("Signed, padded, partial and oversized input is rejected") {
  using shor::parse_u64;
  for (const std::string s : {"", "-5", "-5x", "+5", " 21", "21 ", "21x",
                              "x21", "0x15", "1e3", "--seed=3",
                              "18446744073709551616"}) {
    REQUIRE_FALSE(parse_u64(s).has_value());
  }
}
