/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_record.h"

#include "rdb/rdb_error.h"
#include "rdb/rdb_length.h"
#include "utils/log.h"

namespace rdbdump::rdb {
namespace {
template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

std::string line_label(std::size_t first_line) {
    return std::string("fragment at line ") + std::to_string(first_line);
}

std::vector<std::uint8_t> encode_body(const StringRecord& rec) {
    std::vector<std::uint8_t> out;
    out.reserve(1 + rec.key.size() + rec.value.size() + 18);
    out.push_back(kTypeString);
    append_string(out, rec.key);
    append_string(out, rec.value);
    return out;
}

std::vector<std::uint8_t> encode_body(const SetRecord& rec) {
    std::vector<std::uint8_t> out;
    out.push_back(kTypeSet);
    append_string(out, rec.key);
    append_length(out, static_cast<std::uint64_t>(rec.members.size()));
    for (const auto& m : rec.members) {
        append_string(out, m);
    }
    return out;
}

std::vector<std::uint8_t> encode_body(const HashRecord& rec) {
    std::vector<std::uint8_t> out;
    out.push_back(kTypeHash);
    append_string(out, rec.key);
    append_length(out, static_cast<std::uint64_t>(rec.fields.size()));
    for (const auto& [field, value] : rec.fields) {
        append_string(out, field);
        append_string(out, value);
    }
    return out;
}
}  // namespace

TomlValue parse_fragment(const std::string& text, std::size_t first_line) {
    try {
        return toml::parse_str<toml::ordered_type_config>(text);
    } catch (const toml::exception& e) {
        throw RdbError(
            ErrorKind::MalformedFragment,
            std::string("Invalid TOML in ") + line_label(first_line) + ": " + e.what()
        );
    }
}

Record classify(const std::string& key, const TomlValue& value) {
    if (value.is_array()) {
        SetRecord rec{key, {}};
        const auto& items = value.as_array();
        rec.members.reserve(items.size());
        for (const auto& item : items) {
            rec.members.push_back(stringify_scalar(item));
        }
        return rec;
    }
    if (value.is_table()) {
        HashRecord rec{key, {}};
        const auto& table = value.as_table();
        rec.fields.reserve(table.size());
        for (const auto& [field, field_value] : table) {
            rec.fields.emplace_back(field, stringify_scalar(field_value));
        }
        return rec;
    }
    return StringRecord{key, stringify_scalar(value)};
}

Record make_record(const TomlValue& document, std::size_t first_line) {
    if (!document.is_table() || document.as_table().empty()) {
        throw RdbError(
            ErrorKind::InvalidKeyedRecord,
            std::string("No top-level key in ") + line_label(first_line)
        );
    }
    const auto& table = document.as_table();
    if (table.size() > 1) {
        RDBDUMP_LOG_DEBUG(
            "%s declares %zu top-level keys, only '%s' is written",
            line_label(first_line).c_str(), table.size(), table.begin()->first.c_str()
        );
    }
    const auto& [key, value] = *table.begin();
    return classify(key, value);
}

Record record_from_fragment(const std::string& text, std::size_t first_line) {
    const TomlValue document = parse_fragment(text, first_line);
    return make_record(document, first_line);
}

const std::string& record_key(const Record& record) {
    return std::visit([](const auto& rec) -> const std::string& { return rec.key; }, record);
}

std::string_view record_kind_name(const Record& record) {
    return std::visit(
        overloaded{
            [](const StringRecord&) { return std::string_view("string"); },
            [](const SetRecord&) { return std::string_view("set"); },
            [](const HashRecord&) { return std::string_view("hash"); },
        },
        record
    );
}

std::vector<std::uint8_t> encode_record(const Record& record) {
    return std::visit([](const auto& rec) { return encode_body(rec); }, record);
}

std::uint64_t write_record(const Record& record, ChecksumSink& sink) {
    const auto bytes = encode_record(record);
    return sink.write(bytes);
}
}  // namespace rdbdump::rdb
