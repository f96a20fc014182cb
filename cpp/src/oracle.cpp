// src/oracle.cpp
#include "shor/oracle.hpp"
#include "shor/numtheory.hpp"
#include "shor/shor.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace shor {

std::uint64_t ClassicalPeriodOracle::find_period(std::uint64_t n,
                                                 std::uint64_t a) {
  ++calls_;
  if (n < 2)
    throw NoResult("modulus must be >= 2");
  a %= n;
  if (gcd(a, n) != 1)
    throw NoResult("base " + std::to_string(a) + " is not coprime with " +
                   std::to_string(n) + "; no period exists");

  const std::uint64_t budget = cfg_.max_steps ? cfg_.max_steps : n;
  const bool timed = cfg_.timeout_ms != 0;
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(cfg_.timeout_ms);

  // Smallest r >= 1 with a^r == 1 (mod n).
  std::uint64_t x = a;
  std::uint64_t r = 1;
  while (x != 1) {
    if (r >= budget)
      throw NoResult("no period of " + std::to_string(a) + " mod " +
                     std::to_string(n) + " within " + std::to_string(budget) +
                     " steps");
    // Clock reads are throttled; the check is cooperative.
    if (timed && (r & 0xFFFFu) == 0 &&
        std::chrono::steady_clock::now() >= deadline)
      throw BackendUnavailable("period search timed out after " +
                               std::to_string(cfg_.timeout_ms) + " ms");
    x = mul_mod(x, a, n);
    ++r;
  }
  return r;
}

} // namespace shor
