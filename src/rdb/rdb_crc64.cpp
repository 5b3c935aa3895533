/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb_crc64.h"

#include <array>

namespace rdbdump::rdb {
namespace {
// 0xad93d23594c935a9 bit-reversed.
constexpr std::uint64_t poly = 0x95AC9329AC4BC9B5ull;

constexpr std::array<std::uint64_t, 256> make_table() {
    std::array<std::uint64_t, 256> table{};
    for (std::uint64_t i = 0; i < 256; i++) {
        std::uint64_t crc = i;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 1u) != 0 ? (crc >> 1) ^ poly : (crc >> 1);
        }
        table[static_cast<std::size_t>(i)] = crc;
    }
    return table;
}

constexpr std::array<std::uint64_t, 256> kTable = make_table();
}  // namespace

std::uint64_t crc64_jones(std::uint64_t seed, const std::uint8_t* data, std::size_t len) {
    std::uint64_t crc = seed;
    for (std::size_t i = 0; i < len; i++) {
        const std::size_t idx = static_cast<std::size_t>((crc ^ data[i]) & 0xFFu);
        crc = kTable[idx] ^ (crc >> 8);
    }
    return crc;
}
}  // namespace rdbdump::rdb
