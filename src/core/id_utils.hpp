#ifndef AGENTWATCH_CORE_ID_UTILS_HPP_
#define AGENTWATCH_CORE_ID_UTILS_HPP_

#include <cstdint>
#include <random>
#include <string>

namespace agentwatch::core {

// Generates a 12-character lowercase hex identifier for events and runs.
// Each thread owns its engine so concurrent ingest never contends on it.
inline std::string GenerateShortId() {
  thread_local std::mt19937_64 engine{[] {
    std::random_device device;
    const std::uint64_t high = static_cast<std::uint64_t>(device()) << 32U;
    return high ^ static_cast<std::uint64_t>(device());
  }()};

  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::uint64_t bits = engine();
  std::string id(12, '0');
  for (char& ch : id) {
    ch = kHexDigits[bits & 0xFU];
    bits >>= 4U;
  }
  return id;
}

} // namespace agentwatch::core

#endif // AGENTWATCH_CORE_ID_UTILS_HPP_
