#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace coord::util {

/*
  Identifier helpers

  Lease ids are random RFC4122 v4 UUIDs in canonical 8-4-4-4-12 form.
  Temp-file suffixes use a shorter random hex token.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical string of a fresh v4 UUID.
std::string NewId();

// `hex_chars` lowercase hex characters from the same generator.
std::string ShortId(size_t hex_chars = 8);

} // namespace coord::util
