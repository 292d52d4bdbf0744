#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace roster::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<uint8_t, 16> bytes{};
  for (auto& b : bytes)
    b = static_cast<uint8_t>(rng());

  // version 4, RFC4122 variant
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

} // namespace roster::util
