/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <span>

namespace rdbdump::rdb {
/**
 * Output side of one conversion pass. Bytes written through write() are
 * forwarded to the stream and folded into the running CRC-64, which starts at
 * zero and is never reset. write_unchecksummed() exists only for the trailer.
 */
class ChecksumSink {
   public:
    explicit ChecksumSink(std::ostream& out) : out_(out) {}

    ChecksumSink(const ChecksumSink&) = delete;
    ChecksumSink& operator=(const ChecksumSink&) = delete;

    std::uint64_t write(std::span<const std::uint8_t> bytes);
    void write_unchecksummed(std::span<const std::uint8_t> bytes);
    void flush();

    std::uint64_t checksum() const { return crc_; }
    std::uint64_t bytes_written() const { return bytes_written_; }

   private:
    void put(std::span<const std::uint8_t> bytes);

    std::ostream& out_;
    std::uint64_t crc_ = 0;
    std::uint64_t bytes_written_ = 0;
};
}  // namespace rdbdump::rdb
