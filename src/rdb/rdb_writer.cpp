/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_writer.h"

#include "rdb/rdb_length.h"
#include "utils/log.h"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace rdbdump::rdb {
std::vector<std::uint8_t> build_header(unsigned version) {
    if (version > kMaxRdbVersion) {
        throw std::invalid_argument(
            std::string("RDB version does not fit in 4 digits: ") + std::to_string(version)
        );
    }
    char magic[16]{};
    std::snprintf(magic, sizeof(magic), "REDIS%04u", version);
    std::vector<std::uint8_t> out(magic, magic + 9);
    out.push_back(kOpSelectDb);
    out.push_back(0x00);
    return out;
}

RdbWriter::RdbWriter(std::ostream& out, unsigned version) : sink_(out), version_(version) {
    if (version_ > kMaxRdbVersion) {
        throw std::invalid_argument(
            std::string("RDB version does not fit in 4 digits: ") + std::to_string(version_)
        );
    }
}

void RdbWriter::write_header() {
    sink_.write(build_header(version_));
}

void RdbWriter::write_record(const Record& record) {
    rdb::write_record(record, sink_);
    if (std::holds_alternative<StringRecord>(record)) {
        counts_.strings++;
    } else if (std::holds_alternative<SetRecord>(record)) {
        counts_.sets++;
    } else {
        counts_.hashes++;
    }
}

void RdbWriter::write_fragment(const Fragment& fragment) {
    const Record record = record_from_fragment(fragment.text, fragment.first_line);
    RDBDUMP_LOG_DEBUG(
        "line %zu: %s '%s'", fragment.first_line, std::string(record_kind_name(record)).c_str(),
        record_key(record).c_str()
    );
    write_record(record);
}

std::uint64_t RdbWriter::write_trailer() {
    const std::uint8_t eof[] = {kOpEof};
    const std::uint64_t crc = sink_.write(eof);
    std::vector<std::uint8_t> crc_bytes;
    write_u64_le(crc_bytes, crc);
    sink_.write_unchecksummed(crc_bytes);
    sink_.flush();
    return crc;
}

std::uint64_t RdbWriter::write_stream(std::istream& in) {
    write_header();
    StreamSegmenter segmenter([this](const Fragment& fragment) { write_fragment(fragment); });
    segment_stream(in, segmenter);
    return write_trailer();
}
}  // namespace rdbdump::rdb
