// include/shor/shor.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shor {

inline constexpr const char* SHOR_VERSION = "0.1.0";

class PeriodOracle;

// Nontrivial split of N: first * second == N, 1 < first, second < N.
struct FactorPair {
  std::uint64_t first = 0;
  std::uint64_t second = 0;
};

inline bool operator==(const FactorPair& a, const FactorPair& b) {
  return a.first == b.first && a.second == b.second;
}

// Why a (N, a, r) triple did or did not yield factors.
enum class Reduction {
  Factored,
  OddPeriod,
  TrivialRoot,   // a^(r/2) == -1 (mod N)
  DegenerateGcd, // gcd(N, x -/+ 1) in {1, N}, includes x == 1
};

const char* to_string(Reduction r) noexcept;

struct Classified {
  Reduction kind = Reduction::DegenerateGcd;
  std::optional<FactorPair> pair;
};

// ---- Errors ----

// N < 2, N prime or N a prime power. Raised before the oracle is consulted.
class InvalidInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Base class for failures reported by a PeriodOracle.
class OracleError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The execution service could not be reached (or timed out).
class BackendUnavailable : public OracleError {
public:
  using OracleError::OracleError;
};

// The backend ran but produced no usable period estimate.
class NoResult : public OracleError {
public:
  using OracleError::OracleError;
};

// Per-outcome tally of failed attempts.
struct AttemptStats {
  std::uint32_t attempts = 0;
  std::uint32_t odd_periods = 0;
  std::uint32_t trivial_roots = 0;
  std::uint32_t degenerate = 0;
  std::uint32_t oracle_failures = 0;
};

// All attempts used without finding a factor. Retrying with more attempts
// may succeed.
class Exhausted : public std::runtime_error {
public:
  Exhausted(std::uint64_t n, const AttemptStats& stats);

  std::uint64_t n() const noexcept { return n_; }
  const AttemptStats& stats() const noexcept { return stats_; }

private:
  std::uint64_t n_;
  AttemptStats stats_;
};

// ---- Driver ----

struct FactorConfig {
  std::uint64_t n;                   // modulus to split
  std::uint32_t max_attempts = 16;   // bases tried before giving up
  std::uint64_t seed = 0;            // 0 = std::random_device
  bool enable_progress = true;       // allow callbacks
};

enum class AttemptOutcome {
  SharedFactor, // gcd(a, N) != 1, oracle skipped
  Factored,
  OddPeriod,
  TrivialRoot,
  DegenerateGcd,
  OracleFailed,
};

const char* to_string(AttemptOutcome o) noexcept;

// One pass of the retry loop, reported through AttemptCb.
struct Attempt {
  std::uint32_t index = 0;   // 0-based
  std::uint64_t base = 0;
  std::uint64_t period = 0;  // 0 when the oracle was not consulted or failed
  AttemptOutcome outcome = AttemptOutcome::OracleFailed;
  std::string detail;        // oracle error message, if any
};

using AttemptCb = std::function<void(const Attempt&)>;

struct FactorResult {
  std::uint64_t n = 0;
  FactorPair factors;
  std::uint32_t attempts = 0;     // attempts used, including the winning one
  std::uint64_t base = 0;         // base that produced the split
  std::uint64_t period = 0;       // 0 when via_gcd
  bool via_gcd = false;           // random base already shared a factor
  std::uint64_t ns_elapsed = 0;   // wall-clock nanoseconds (best effort)
  std::string engine_info;        // e.g., "gmp:6.3.0; gcc:13.2.0"
};

// Classical post-processing: turns a period r of a mod N into factors.
// Throws InvalidInput if n < 2.
Classified classify(std::uint64_t n, std::uint64_t a, std::uint64_t r);
std::optional<FactorPair> reduce(std::uint64_t n, std::uint64_t a,
                                 std::uint64_t r);

// Picks random bases, asks the oracle for periods and reduces them.
// Throws InvalidInput for unsuitable N and Exhausted when max_attempts
// bases all failed. Oracle errors are retried; any other exception thrown
// by the oracle propagates.
FactorResult factor(const FactorConfig& cfg, PeriodOracle& oracle,
                    const AttemptCb& cb = {});

FactorPair factor(std::uint64_t n, PeriodOracle& oracle,
                  std::uint32_t max_attempts);

// Prime factors of n in ascending order, with multiplicity.
std::vector<std::uint64_t> factorize(std::uint64_t n, PeriodOracle& oracle,
                                     std::uint32_t max_attempts = 16,
                                     std::uint64_t seed = 0);

std::string engine_info();

} // namespace shor
