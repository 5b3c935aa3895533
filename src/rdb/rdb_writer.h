/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include "rdb/rdb_checksum_sink.h"
#include "rdb/rdb_record.h"
#include "rdb/rdb_segmenter.h"

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace rdbdump::rdb {
constexpr std::uint8_t kOpSelectDb = 0xFE;
constexpr std::uint8_t kOpEof = 0xFF;
constexpr unsigned kMaxRdbVersion = 9999;

struct RecordCounts {
    std::uint64_t strings = 0;
    std::uint64_t sets = 0;
    std::uint64_t hashes = 0;

    std::uint64_t total() const { return strings + sets + hashes; }
};

// "REDIS" + zero padded 4 digit version + SELECTDB 0.
std::vector<std::uint8_t> build_header(unsigned version);

/**
 * Frames one RDB file: header, records, EOF opcode and the little-endian
 * CRC-64 of everything before it. Only database 0 is written and no
 * RESIZEDB/AUX/expiry opcodes are emitted.
 */
class RdbWriter {
   public:
    RdbWriter(std::ostream& out, unsigned version);

    void write_header();
    void write_record(const Record& record);
    void write_fragment(const Fragment& fragment);
    std::uint64_t write_trailer();

    // Header, every fragment of `in`, trailer.
    std::uint64_t write_stream(std::istream& in);

    const RecordCounts& counts() const { return counts_; }
    std::uint64_t bytes_written() const { return sink_.bytes_written(); }
    std::uint64_t checksum() const { return sink_.checksum(); }

   private:
    ChecksumSink sink_;
    unsigned version_;
    RecordCounts counts_;
};
}  // namespace rdbdump::rdb
