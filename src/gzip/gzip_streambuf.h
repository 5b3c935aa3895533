/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <zlib.h>

#include <cstddef>
#include <istream>
#include <streambuf>
#include <vector>

namespace rdbdump::gzip {
/**
 * Read-only streambuf inflating gzip data from another istream. Concatenated
 * members are decoded back to back. Corrupt or truncated input throws
 * rdb::RdbError(IoFailure) out of underflow(); set badbit in the owning
 * istream's exception mask to let it reach the caller.
 */
class GzipInputBuffer : public std::streambuf {
   public:
    explicit GzipInputBuffer(std::istream& source, std::size_t chunk_bytes = 64 * 1024);
    ~GzipInputBuffer() override;

    GzipInputBuffer(const GzipInputBuffer&) = delete;
    GzipInputBuffer& operator=(const GzipInputBuffer&) = delete;

    std::size_t compressed_bytes_read() const { return compressed_read_; }
    std::size_t members_decoded() const { return members_; }

   protected:
    int_type underflow() override;

   private:
    bool refill_input();
    [[noreturn]] void fail(const char* what, int code);

    std::istream& source_;
    z_stream zs_{};
    std::vector<char> in_buf_;
    std::vector<char> out_buf_;
    std::size_t compressed_read_ = 0;
    std::size_t members_ = 0;
    bool member_open_ = false;
    bool source_eof_ = false;
};
}  // namespace rdbdump::gzip
