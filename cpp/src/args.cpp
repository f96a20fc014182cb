// src/args.cpp
#include "shor/args.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace shor {

std::optional<std::uint64_t> parse_u64(const std::string& s) {
  // stoull skips leading blanks and accepts '-' (wrapping the value), so the
  // first character has to be a digit.
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    return std::nullopt;

  std::size_t pos = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(s, &pos, 10);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (pos != s.size())
    return std::nullopt;
  return static_cast<std::uint64_t>(v);
}

} // namespace shor
