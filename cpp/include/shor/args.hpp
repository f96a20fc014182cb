// include/shor/args.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace shor {

// Parses a plain decimal unsigned integer. The whole string must be digits;
// signs, whitespace, trailing text and values above 2^64-1 are rejected.
std::optional<std::uint64_t> parse_u64(const std::string& s);

} // namespace shor
