#include "uuid.hpp"

#include <unistd.h>

#include <random>

namespace coord::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// A forked child inherits the parent's engine state; reseed once the pid changes.
std::mt19937_64& Engine() {
  static thread_local std::mt19937_64 engine;
  static thread_local pid_t           seeded_for = 0;

  const auto pid = ::getpid();
  if (seeded_for != pid) {
    std::random_device device;
    engine.seed((static_cast<uint64_t>(device()) << 32) ^ device() ^ static_cast<uint64_t>(pid));
    seeded_for = pid;
  }
  return engine;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  auto& engine = Engine();
  for (size_t offset = 0; offset < id.size(); offset += 8) {
    auto word = engine();
    for (size_t i = 0; i < 8; ++i) {
      id[offset + i] = static_cast<uint8_t>(word >> (i * 8));
    }
  }

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40); // version 4
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80); // RFC4122 variant
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

std::string ShortId(size_t hex_chars) {
  std::string out;
  out.reserve(hex_chars);
  auto& engine = Engine();
  while (out.size() < hex_chars) {
    auto word = engine();
    for (int i = 0; i < 16 && out.size() < hex_chars; ++i, word >>= 4) {
      out.push_back(kHexDigits[word & 0x0F]);
    }
  }
  return out;
}

} // namespace coord::util
