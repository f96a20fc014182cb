// src/mpz_u64.hpp
// Internal: exact uint64 <-> mpz_t transfers (unsigned long may be 32-bit).
#pragma once
#include <cstdint>
#include <gmp.h>

namespace shor {
namespace detail {

inline void mpz_set_u64(mpz_t rop, std::uint64_t v) {
  mpz_import(rop, 1, -1, sizeof(v), 0, 0, &v);
}

// Caller guarantees 0 <= op < 2^64.
inline std::uint64_t mpz_get_u64(const mpz_t op) {
  std::uint64_t v = 0;
  mpz_export(&v, nullptr, -1, sizeof(v), 0, 0, op);
  return v;
}

} // namespace detail
} // namespace shor
