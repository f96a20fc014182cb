// include/shor/oracle.hpp
#pragma once
#include <cstdint>

namespace shor {

// Period-finding backend. Implementations return r > 0 with
// a^r == 1 (mod n), or throw BackendUnavailable / NoResult (see shor.hpp).
class PeriodOracle {
public:
  virtual ~PeriodOracle() = default;
  virtual std::uint64_t find_period(std::uint64_t n, std::uint64_t a) = 0;
};

struct OracleConfig {
  std::uint64_t max_steps = 0;   // 0 = n (no order modulo n exceeds it)
  std::uint32_t timeout_ms = 0;  // 0 = no deadline
};

// Classical order finding by repeated multiplication. Stands in for a
// simulated backend; exponential in the bit length of n.
class ClassicalPeriodOracle : public PeriodOracle {
public:
  explicit ClassicalPeriodOracle(OracleConfig cfg = {}) : cfg_(cfg) {}

  std::uint64_t find_period(std::uint64_t n, std::uint64_t a) override;

  std::uint64_t calls() const noexcept { return calls_; }

private:
  OracleConfig cfg_;
  std::uint64_t calls_ = 0;
};

} // namespace shor
