#include "shor/numtheory.hpp"
#include "shor/oracle.hpp"
#include "shor/shor.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>

TEST_CASE("Textbook scenarios: 21 with a=2, 15 with a=7") {
  using shor::FactorPair; using shor::reduce;

  auto p21 = reduce(21, 2, 6);   // x = 8, gcd(21,7) = 7, gcd(21,9) = 3
  REQUIRE(p21.has_value());
  REQUIRE(*p21 == FactorPair{7, 3});

  auto p15 = reduce(15, 7, 4);   // x = 4, gcd(15,3) = 3, gcd(15,5) = 5
  REQUIRE(p15.has_value());
  REQUIRE(*p15 == FactorPair{3, 5});
}

TEST_CASE("Odd periods never reduce") {
  using shor::Reduction; using shor::classify; using shor::reduce;
  REQUIRE_FALSE(reduce(21, 2, 3).has_value());
  REQUIRE_FALSE(reduce(15, 7, 1).has_value());
  REQUIRE_FALSE(reduce(35, 2, 11).has_value());
  REQUIRE(classify(21, 4, 3).kind == Reduction::OddPeriod);
}

TEST_CASE("a^(r/2) == -1 is a trivial square root") {
  using shor::Reduction; using shor::classify; using shor::reduce;
  // 5 has order 6 mod 21 and 5^3 = 125 = 20 (mod 21).
  REQUIRE_FALSE(reduce(21, 5, 6).has_value());
  REQUIRE(classify(21, 5, 6).kind == Reduction::TrivialRoot);
  REQUIRE(classify(15, 14, 2).kind == Reduction::TrivialRoot);
}

TEST_CASE("x == 1 gives a degenerate gcd") {
  using shor::Reduction; using shor::classify;
  // 4 has order 2 mod 15; r = 4 is a multiple, so 4^2 == 1.
  auto c = classify(15, 4, 4);
  REQUIRE(c.kind == Reduction::DegenerateGcd);
  REQUIRE_FALSE(c.pair.has_value());
  REQUIRE(classify(21, 2, 0).kind == Reduction::DegenerateGcd);
}

TEST_CASE("Modulus below 2 is rejected") {
  REQUIRE_THROWS_AS(shor::reduce(0, 2, 2), shor::InvalidInput);
  REQUIRE_THROWS_AS(shor::classify(1, 2, 2), shor::InvalidInput);
}

TEST_CASE("True periods of every coprime base reduce to valid splits") {
  using shor::Reduction;
  shor::ClassicalPeriodOracle oracle;

  for (std::uint64_t n : {15u, 21u, 33u, 35u, 39u, 51u, 55u, 77u, 91u, 221u,
                          1001u}) {
    unsigned factored = 0;
    for (std::uint64_t a = 2; a < n; ++a) {
      if (shor::gcd(a, n) != 1)
        continue;
      const std::uint64_t r = oracle.find_period(n, a);
      REQUIRE(shor::pow_mod(a, r, n) == 1);

      auto c = shor::classify(n, a, r);
      // A minimal period never leaves x == 1, so the gcds are never trivial.
      REQUIRE(c.kind != Reduction::DegenerateGcd);
      if (r % 2 == 1) {
        REQUIRE(c.kind == Reduction::OddPeriod);
      } else if (shor::pow_mod(a, r / 2, n) == n - 1) {
        REQUIRE(c.kind == Reduction::TrivialRoot);
      } else {
        REQUIRE(c.kind == Reduction::Factored);
        REQUIRE(c.pair.has_value());
        REQUIRE(c.pair->first * c.pair->second == n);
        REQUIRE(c.pair->first > 1);
        REQUIRE(c.pair->first < n);
        REQUIRE(c.pair->second > 1);
        REQUIRE(c.pair->second < n);
        ++factored;
      }
    }
    REQUIRE(factored > 0);
  }
}
