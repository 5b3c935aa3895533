/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_checksum_sink.h"

#include "rdb/rdb_crc64.h"
#include "rdb/rdb_error.h"

#include <string>

namespace rdbdump::rdb {
void ChecksumSink::put(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        return;
    }
    out_.write(
        reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())
    );
    if (!out_) {
        throw RdbError(
            ErrorKind::IoFailure,
            std::string("Failed to write ") + std::to_string(bytes.size())
                + " bytes to output at offset " + std::to_string(bytes_written_)
        );
    }
    bytes_written_ += bytes.size();
}

std::uint64_t ChecksumSink::write(std::span<const std::uint8_t> bytes) {
    put(bytes);
    crc_ = crc64_jones(crc_, bytes);
    return crc_;
}

void ChecksumSink::write_unchecksummed(std::span<const std::uint8_t> bytes) {
    put(bytes);
}

void ChecksumSink::flush() {
    out_.flush();
    if (!out_) {
        throw RdbError(ErrorKind::IoFailure, std::string("Failed to flush output"));
    }
}
}  // namespace rdbdump::rdb
