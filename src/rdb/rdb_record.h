/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include "rdb/rdb_checksum_sink.h"
#include "rdb/rdb_scalar.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rdbdump::rdb {
constexpr std::uint8_t kTypeString = 0x00;
constexpr std::uint8_t kTypeSet = 0x02;
constexpr std::uint8_t kTypeHash = 0x04;

struct StringRecord {
    std::string key;
    std::string value;
};

// Members keep source order; duplicates are not removed.
struct SetRecord {
    std::string key;
    std::vector<std::string> members;
};

struct HashRecord {
    std::string key;
    std::vector<std::pair<std::string, std::string>> fields;
};

using Record = std::variant<StringRecord, SetRecord, HashRecord>;

TomlValue parse_fragment(const std::string& text, std::size_t first_line = 1);

// Picks the on-disk shape from the top-level tag only. Elements of arrays and
// values of tables go through stringify_scalar.
Record classify(const std::string& key, const TomlValue& value);

// First top-level key of the document, in declaration order.
Record make_record(const TomlValue& document, std::size_t first_line = 1);

Record record_from_fragment(const std::string& text, std::size_t first_line = 1);

const std::string& record_key(const Record& record);
std::string_view record_kind_name(const Record& record);

std::vector<std::uint8_t> encode_record(const Record& record);
std::uint64_t write_record(const Record& record, ChecksumSink& sink);
}  // namespace rdbdump::rdb
