#include "rmm/common/id.hpp"

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <random>

namespace rmm::common {

namespace {

template <std::size_t N> std::array<unsigned char, N> random_bytes() {
  std::array<unsigned char, N> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    // CSPRNG unavailable: fall back to the OS entropy source
    std::random_device device;
    for (auto &byte : bytes) {
      byte = static_cast<unsigned char>(device() & 0xFF);
    }
  }
  return bytes;
}

} // namespace

std::string generate_uuid() {
  auto bytes = random_bytes<16>();
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::string out;
  out.reserve(36);
  char hex[3];
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    std::snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned int>(bytes[i]));
    out += hex;
  }
  return out;
}

std::uint64_t random_seed() {
  const auto bytes = random_bytes<8>();
  std::uint64_t seed = 0;
  for (const unsigned char byte : bytes) {
    seed = (seed << 8) | byte;
  }
  return seed;
}

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace rmm::common
