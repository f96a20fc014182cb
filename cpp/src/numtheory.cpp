// src/numtheory.cpp
#include "shor/numtheory.hpp"
#include "mpz_u64.hpp"

#include <cstdint>
#include <gmp.h>

namespace shor {

std::uint64_t mul_mod(std::uint64_t a, std::uint64_t b,
                      std::uint64_t m) noexcept {
  // The product of two residues fits in 128 bits.
  const __uint128_t wide = static_cast<__uint128_t>(a) * b;
  return static_cast<std::uint64_t>(wide % m);
}

std::uint64_t pow_mod(std::uint64_t a, std::uint64_t e,
                      std::uint64_t m) noexcept {
  std::uint64_t acc = 1 % m;
  for (a %= m; e != 0; e >>= 1) {
    if (e & 1)
      acc = mul_mod(acc, a, m);
    a = mul_mod(a, a, m);
  }
  return acc;
}

std::uint64_t gcd(std::uint64_t a, std::uint64_t b) noexcept {
  while (b) {
    std::uint64_t t = a % b;
    a = b;
    b = t;
  }
  return a;
}

namespace {

// One strong-probable-prime round for odd n > 37, with n - 1 = d * 2^s.
bool strong_probable_prime(std::uint64_t n, std::uint64_t d, unsigned s,
                           std::uint64_t base) {
  std::uint64_t x = pow_mod(base, d, n);
  if (x == 1 || x == n - 1)
    return true;
  while (--s > 0) {
    x = mul_mod(x, x, n);
    if (x == n - 1)
      return true;
  }
  return false;
}

} // namespace

bool is_prime(std::uint64_t n) noexcept {
  if (n < 2)
    return false;

  static constexpr std::uint64_t kBases[] = {2u,  3u,  5u,  7u,  11u, 13u,
                                             17u, 19u, 23u, 29u, 31u, 37u};
  for (std::uint64_t p : kBases) {
    if (n % p == 0)
      return n == p;
  }

  std::uint64_t d = n - 1;
  unsigned s = 0;
  for (; (d & 1u) == 0; d >>= 1)
    ++s;

  // These twelve bases leave no strong pseudoprime below 2^64.
  for (std::uint64_t base : kBases) {
    if (!strong_probable_prime(n, d, s, base))
      return false;
  }
  return true;
}

std::uint64_t prime_power_base(std::uint64_t n) noexcept {
  if (n < 2)
    return 0;
  if (is_prime(n))
    return n;
  if ((n & 1u) == 0)
    return (n & (n - 1)) ? 0 : 2; // only 2^k is an even prime power

  mpz_t N, root;
  mpz_init(N);
  mpz_init(root);
  detail::mpz_set_u64(N, n);

  // n odd here, so any base is >= 3 and k <= log_3(2^64) < 41.
  std::uint64_t found = 0;
  for (unsigned long k = 2; k <= 40; ++k) {
    if (mpz_root(root, N, k) == 0)
      continue; // not an exact k-th power
    std::uint64_t p = detail::mpz_get_u64(root);
    if (is_prime(p)) {
      found = p;
      break;
    }
  }

  mpz_clear(N);
  mpz_clear(root);
  return found;
}

} // namespace shor
