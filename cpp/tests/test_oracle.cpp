#include "shor/oracle.hpp"
#include "shor/shor.hpp"
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Classical oracle returns the multiplicative order") {
  shor::ClassicalPeriodOracle oracle;
  REQUIRE(oracle.find_period(21, 2) == 6);
  REQUIRE(oracle.find_period(21, 5) == 6);
  REQUIRE(oracle.find_period(15, 7) == 4);
  REQUIRE(oracle.find_period(15, 4) == 2);
  REQUIRE(oracle.find_period(35, 2) == 12);   // lcm(4, 3)
  REQUIRE(oracle.find_period(21, 22) == 1);   // 22 == 1 (mod 21)
  REQUIRE(oracle.calls() == 6);
}

TEST_CASE("No period for a base sharing a factor") {
  shor::ClassicalPeriodOracle oracle;
  REQUIRE_THROWS_AS(oracle.find_period(21, 3), shor::NoResult);
  REQUIRE_THROWS_AS(oracle.find_period(21, 14), shor::NoResult);
  REQUIRE_THROWS_AS(oracle.find_period(1, 2), shor::NoResult);
}

TEST_CASE("Step budget bounds the search") {
  shor::ClassicalPeriodOracle tight(shor::OracleConfig{3, 0});
  REQUIRE_THROWS_AS(tight.find_period(21, 2), shor::NoResult);

  shor::ClassicalPeriodOracle exact(shor::OracleConfig{6, 0});
  REQUIRE(exact.find_period(21, 2) == 6);
}

TEST_CASE("Stalled search times out as an unavailable backend") {
  // 2 has order >= 500000003 modulo this semiprime.
  const std::uint64_t n = 1000000007ull * 998244353ull;
  shor::ClassicalPeriodOracle oracle(shor::OracleConfig{0, 1});
  REQUIRE_THROWS_AS(oracle.find_period(n, 2), shor::BackendUnavailable);
}
