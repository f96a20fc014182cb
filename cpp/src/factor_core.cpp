// src/factor_core.cpp
#include "shor/numtheory.hpp"
#include "shor/oracle.hpp"
#include "shor/shor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <random>
#include <string>
#include <vector>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

std::string stats_message(std::uint64_t n, const shor::AttemptStats& s) {
  return "no nontrivial factor of " + std::to_string(n) + " after " +
         std::to_string(s.attempts) + " attempts (odd periods: " +
         std::to_string(s.odd_periods) +
         ", trivial roots: " + std::to_string(s.trivial_roots) +
         ", degenerate gcds: " + std::to_string(s.degenerate) +
         ", oracle failures: " + std::to_string(s.oracle_failures) + ")";
}

// Rejects moduli the classical reduction cannot split.
void validate_modulus(std::uint64_t n) {
  if (n < 2)
    throw shor::InvalidInput("modulus must be >= 2");
  if (shor::is_prime(n))
    throw shor::InvalidInput(std::to_string(n) + " is prime");
  if (std::uint64_t p = shor::prime_power_base(n))
    throw shor::InvalidInput(std::to_string(n) + " is a power of the prime " +
                             std::to_string(p));
}
} // namespace

namespace shor {

Exhausted::Exhausted(std::uint64_t n, const AttemptStats& stats)
    : std::runtime_error(stats_message(n, stats)), n_(n), stats_(stats) {}

const char* to_string(AttemptOutcome o) noexcept {
  switch (o) {
  case AttemptOutcome::SharedFactor:
    return "shared factor";
  case AttemptOutcome::Factored:
    return "factored";
  case AttemptOutcome::OddPeriod:
    return "odd period";
  case AttemptOutcome::TrivialRoot:
    return "trivial square root";
  case AttemptOutcome::DegenerateGcd:
    return "degenerate gcd";
  case AttemptOutcome::OracleFailed:
    return "oracle failed";
  }
  return "?";
}

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info();
}

FactorResult factor(const FactorConfig& cfg, PeriodOracle& oracle,
                    const AttemptCb& cb) {
  const std::uint64_t n = cfg.n;
  validate_modulus(n); // before any oracle call

  auto t0 = std::chrono::steady_clock::now();

  std::mt19937_64 rng(cfg.seed ? cfg.seed : std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> pick(2, n - 1);

  const bool report = cb && cfg.enable_progress;
  AttemptStats stats;
  FactorResult out;
  out.n = n;

  for (std::uint32_t i = 0; i < cfg.max_attempts; ++i) {
    Attempt at;
    at.index = i;
    at.base = pick(rng);
    ++stats.attempts;

    const std::uint64_t g = gcd(at.base, n);
    if (g != 1) {
      // Lucky draw: the base already shares a factor with n.
      at.outcome = AttemptOutcome::SharedFactor;
      out.factors = FactorPair{g, n / g};
      out.via_gcd = true;
    } else {
      try {
        at.period = oracle.find_period(n, at.base);
      } catch (const OracleError& e) {
        ++stats.oracle_failures;
        at.outcome = AttemptOutcome::OracleFailed;
        at.detail = e.what();
        if (report)
          cb(at);
        continue;
      }

      Classified c = classify(n, at.base, at.period);
      switch (c.kind) {
      case Reduction::Factored:
        at.outcome = AttemptOutcome::Factored;
        out.factors = *c.pair;
        out.period = at.period;
        break;
      case Reduction::OddPeriod:
        at.outcome = AttemptOutcome::OddPeriod;
        ++stats.odd_periods;
        break;
      case Reduction::TrivialRoot:
        at.outcome = AttemptOutcome::TrivialRoot;
        ++stats.trivial_roots;
        break;
      case Reduction::DegenerateGcd:
        at.outcome = AttemptOutcome::DegenerateGcd;
        ++stats.degenerate;
        break;
      }
    }

    if (report)
      cb(at);

    if (at.outcome == AttemptOutcome::SharedFactor ||
        at.outcome == AttemptOutcome::Factored) {
      out.attempts = i + 1;
      out.base = at.base;
      auto t1 = std::chrono::steady_clock::now();
      out.ns_elapsed = static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0)
              .count());
      out.engine_info = engine_info();
      return out;
    }
  }

  throw Exhausted(n, stats);
}

FactorPair factor(std::uint64_t n, PeriodOracle& oracle,
                  std::uint32_t max_attempts) {
  FactorConfig cfg{n, max_attempts, 0, false};
  return factor(cfg, oracle).factors;
}

std::vector<std::uint64_t> factorize(std::uint64_t n, PeriodOracle& oracle,
                                     std::uint32_t max_attempts,
                                     std::uint64_t seed) {
  if (n < 2)
    throw InvalidInput("modulus must be >= 2");

  std::vector<std::uint64_t> primes;
  std::vector<std::uint64_t> pending{n};
  std::uint64_t splits = 0;

  while (!pending.empty()) {
    std::uint64_t m = pending.back();
    pending.pop_back();

    if (std::uint64_t p = prime_power_base(m)) {
      for (; m > 1; m /= p)
        primes.push_back(p);
      continue;
    }

    // Distinct but reproducible seed per split when the caller fixed one.
    FactorConfig cfg{m, max_attempts, seed ? seed + splits : 0, false};
    ++splits;
    FactorPair fp = factor(cfg, oracle).factors;
    pending.push_back(fp.first);
    pending.push_back(fp.second);
  }

  std::sort(primes.begin(), primes.end());
  return primes;
}

} // namespace shor
