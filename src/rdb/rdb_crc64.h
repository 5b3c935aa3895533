/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace rdbdump::rdb {
// CRC-64/Jones as used by Redis: reflected, init 0, no final xor.
// Feeding the previous result back as seed continues the same checksum.
std::uint64_t crc64_jones(std::uint64_t seed, const std::uint8_t* data, std::size_t len);
inline std::uint64_t crc64_jones(std::uint64_t seed, std::span<const std::uint8_t> bytes) {
    return crc64_jones(seed, bytes.data(), bytes.size());
}
}  // namespace rdbdump::rdb
