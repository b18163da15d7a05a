#include "agentwire/core/uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace agentwire::ids {

namespace {

std::mt19937_64& generator() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  return gen;
}

}  // namespace

std::string uuid_v4() {
  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    uint64_t word = generator()();
    for (size_t k = 0; k < 8; ++k) {
      bytes[i + k] = static_cast<uint8_t>(word >> (k * 8));
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  static const char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(hex[bytes[i] >> 4]);
    out.push_back(hex[bytes[i] & 0x0F]);
  }
  return out;
}

std::string short_id(size_t length) {
  static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

  std::string out(length, '0');
  for (auto& c : out) {
    c = alphabet[pick(generator())];
  }
  return out;
}

}  // namespace agentwire::ids
