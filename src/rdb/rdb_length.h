/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace rdbdump::rdb {
// The two high bits of the first byte select the width of a length.
constexpr std::uint8_t kLen6Bit = 0x00;
constexpr std::uint8_t kLen14Bit = 0x40;
constexpr std::uint8_t kLen32Bit = 0x80;
constexpr std::uint8_t kLen64Bit = 0x81;

void write_u32_be(std::vector<std::uint8_t>& out, std::uint32_t v);
void write_u64_be(std::vector<std::uint8_t>& out, std::uint64_t v);
void write_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v);

void append_length(std::vector<std::uint8_t>& out, std::uint64_t length);
void append_string(std::vector<std::uint8_t>& out, std::string_view s);

std::vector<std::uint8_t> encode_length(std::uint64_t length);
std::vector<std::uint8_t> encode_string(std::string_view s);
}  // namespace rdbdump::rdb
