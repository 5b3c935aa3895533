/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_length.h"

namespace rdbdump::rdb {
void write_u32_be(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

void write_u64_be(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 7; i >= 0; i--) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

void write_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

void append_length(std::vector<std::uint8_t>& out, std::uint64_t length) {
    if (length < (1u << 6)) {
        out.push_back(static_cast<std::uint8_t>(length) | kLen6Bit);
    } else if (length < (1u << 14)) {
        out.push_back(static_cast<std::uint8_t>((length >> 8) & 0x3Fu) | kLen14Bit);
        out.push_back(static_cast<std::uint8_t>(length & 0xFFu));
    } else if (length < 0xFFFFFFFFull) {
        out.push_back(kLen32Bit);
        write_u32_be(out, static_cast<std::uint32_t>(length));
    } else {
        // UINT32_MAX itself already takes the 64-bit form.
        out.push_back(kLen64Bit);
        write_u64_be(out, length);
    }
}

void append_string(std::vector<std::uint8_t>& out, std::string_view s) {
    append_length(out, static_cast<std::uint64_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

std::vector<std::uint8_t> encode_length(std::uint64_t length) {
    std::vector<std::uint8_t> out;
    append_length(out, length);
    return out;
}

std::vector<std::uint8_t> encode_string(std::string_view s) {
    std::vector<std::uint8_t> out;
    out.reserve(s.size() + 9);
    append_string(out, s);
    return out;
}
}  // namespace rdbdump::rdb
