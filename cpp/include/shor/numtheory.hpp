// include/shor/numtheory.hpp
#pragma once
#include <cstdint>

namespace shor {

// Deterministic primality for 64-bit n. Returns true iff n is prime.
// Small-prime trial division followed by Miller–Rabin with the first twelve
// prime bases, which is exact below 2^64.
bool is_prime(std::uint64_t n) noexcept;

// If n == p^k for a prime p and k >= 1, returns p; otherwise 0.
// Primes report themselves (k == 1).
std::uint64_t prime_power_base(std::uint64_t n) noexcept;

std::uint64_t gcd(std::uint64_t a, std::uint64_t b) noexcept;

// (a * b) mod m and a^e mod m without overflow; m must be nonzero.
std::uint64_t mul_mod(std::uint64_t a, std::uint64_t b,
                      std::uint64_t m) noexcept;
std::uint64_t pow_mod(std::uint64_t a, std::uint64_t e,
                      std::uint64_t m) noexcept;

} // namespace shor
