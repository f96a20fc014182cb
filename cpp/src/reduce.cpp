// src/reduce.cpp
#include "shor/shor.hpp"
#include "mpz_u64.hpp"

#include <cstdint>
#include <gmp.h>
#include <optional>

namespace shor {

const char* to_string(Reduction r) noexcept {
  switch (r) {
  case Reduction::Factored:
    return "factored";
  case Reduction::OddPeriod:
    return "odd period";
  case Reduction::TrivialRoot:
    return "trivial square root";
  case Reduction::DegenerateGcd:
    return "degenerate gcd";
  }
  return "?";
}

Classified classify(std::uint64_t n, std::uint64_t a, std::uint64_t r) {
  if (n < 2)
    throw InvalidInput("modulus must be >= 2");

  Classified out;
  if (r & 1u) {
    out.kind = Reduction::OddPeriod;
    return out;
  }

  mpz_t N, x, e, f1, f2;
  mpz_inits(N, x, e, f1, f2, nullptr);
  detail::mpz_set_u64(N, n);
  detail::mpz_set_u64(x, a);
  detail::mpz_set_u64(e, r / 2);

  // x = a^(r/2) mod N
  mpz_powm(x, x, e, N);

  // x == N-1  <=>  x + 1 == N
  mpz_add_ui(f2, x, 1);
  if (mpz_cmp(f2, N) == 0) {
    out.kind = Reduction::TrivialRoot;
  } else {
    mpz_sub_ui(f1, x, 1);
    mpz_gcd(f1, N, f1); // gcd(N, x-1); x == 1 gives gcd(N, 0) == N
    mpz_gcd(f2, N, f2); // gcd(N, x+1)

    if (mpz_cmp_ui(f1, 1) == 0 || mpz_cmp(f1, N) == 0 ||
        mpz_cmp_ui(f2, 1) == 0 || mpz_cmp(f2, N) == 0) {
      out.kind = Reduction::DegenerateGcd;
    } else {
      const std::uint64_t p = detail::mpz_get_u64(f1);
      out.kind = Reduction::Factored;
      out.pair = FactorPair{p, n / p};
    }
  }

  mpz_clears(N, x, e, f1, f2, nullptr);
  return out;
}

std::optional<FactorPair> reduce(std::uint64_t n, std::uint64_t a,
                                 std::uint64_t r) {
  return classify(n, a, r).pair;
}

} // namespace shor
