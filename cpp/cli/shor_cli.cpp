#include "shor/args.hpp"
#include "shor/oracle.hpp"
#include "shor/shor.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace {
// Strictly parsed flag value; nullopt for garbage or values above `max`.
std::optional<std::uint64_t> flag_value(const std::string& a, std::size_t prefix,
                                        std::uint64_t max) {
  auto v = shor::parse_u64(a.substr(prefix));
  if (v && *v > max) return std::nullopt;
  return v;
}
} // namespace

int main(int argc, char** argv) {
  // Flags: --attempts=K, --seed=S, --max-steps=M, --timeout-ms=T, --full, --quiet
  constexpr std::uint64_t u32_max = std::numeric_limits<std::uint32_t>::max();
  std::uint32_t attempts = 16;
  std::uint64_t seed = 0;          // 0 = random
  shor::OracleConfig ocfg;
  ocfg.timeout_ms = 1000;          // per oracle call; 0 = wait forever
  bool full = false, quiet = false;
  std::vector<std::uint64_t> numbers;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::optional<std::uint64_t> v;
    if (a.rfind("--attempts=", 0) == 0) {
      if ((v = flag_value(a, 11, u32_max))) attempts = static_cast<std::uint32_t>(*v);
    } else if (a.rfind("--seed=", 0) == 0) {
      if ((v = flag_value(a, 7, UINT64_MAX))) seed = *v;
    } else if (a.rfind("--max-steps=", 0) == 0) {
      if ((v = flag_value(a, 12, UINT64_MAX))) ocfg.max_steps = *v;
    } else if (a.rfind("--timeout-ms=", 0) == 0) {
      if ((v = flag_value(a, 13, u32_max))) ocfg.timeout_ms = static_cast<std::uint32_t>(*v);
    } else if (a == "--full") {
      full = true;
      continue;
    } else if (a == "--quiet") {
      quiet = true;
      continue;
    } else if ((v = shor::parse_u64(a))) {
      numbers.push_back(*v);
    }
    if (!v) std::cerr << "skip '" << a << "'\n";
  }
  if (numbers.empty()) numbers = {21};

  shor::ClassicalPeriodOracle oracle(ocfg);
  int failures = 0;

  for (auto n : numbers) {
    auto progress = [&](const shor::Attempt& at) {
      std::cout << "  N=" << n << " #" << (at.index + 1) << " a=" << at.base;
      if (at.period) std::cout << " r=" << at.period;
      std::cout << " -> " << shor::to_string(at.outcome);
      if (!at.detail.empty()) std::cout << " (" << at.detail << ")";
      std::cout << "\n";
    };

    try {
      if (full) {
        auto primes = shor::factorize(n, oracle, attempts, seed);
        std::cout << n << " =";
        for (std::size_t k = 0; k < primes.size(); ++k)
          std::cout << (k ? " * " : " ") << primes[k];
        std::cout << "\n";
        continue;
      }
      shor::FactorConfig cfg{n, attempts, seed, !quiet};
      auto res = shor::factor(cfg, oracle, quiet ? shor::AttemptCb{} : progress);
      std::cout << n << " = " << res.factors.first << " * " << res.factors.second
                << " | attempts=" << res.attempts << " | base=" << res.base
                << " | period=" << (res.via_gcd ? std::string("n/a (gcd)")
                                                : std::to_string(res.period))
                << " | core(ns)=" << res.ns_elapsed
                << " | engine=" << res.engine_info << "\n";
    } catch (const shor::InvalidInput& e) {
      std::cerr << "N=" << n << ": invalid input: " << e.what() << "\n";
      ++failures;
    } catch (const shor::Exhausted& e) {
      std::cerr << "N=" << n << ": " << e.what()
                << "; try again with more attempts\n";
      ++failures;
    }
  }
  if (!quiet) std::cout << "oracle calls: " << oracle.calls() << "\n";
  return failures ? 1 : 0;
}
