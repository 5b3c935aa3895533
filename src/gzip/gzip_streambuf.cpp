/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "gzip/gzip_streambuf.h"

#include "rdb/rdb_error.h"
#include "utils/log.h"

#include <string>

namespace rdbdump::gzip {
namespace {
// 16 + MAX_WBITS: gzip wrapper only, no raw zlib or deflate streams.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;
}  // namespace

GzipInputBuffer::GzipInputBuffer(std::istream& source, std::size_t chunk_bytes)
    : source_(source), in_buf_(chunk_bytes), out_buf_(chunk_bytes) {
    zs_.zalloc = Z_NULL;
    zs_.zfree = Z_NULL;
    zs_.opaque = Z_NULL;
    zs_.next_in = Z_NULL;
    zs_.avail_in = 0;
    const int rc = inflateInit2(&zs_, kGzipWindowBits);
    if (rc != Z_OK) {
        throw rdb::RdbError(
            rdb::ErrorKind::IoFailure,
            std::string("zlib inflateInit2 failed (") + std::to_string(rc) + ")"
        );
    }
    setg(out_buf_.data(), out_buf_.data(), out_buf_.data());
}

GzipInputBuffer::~GzipInputBuffer() {
    inflateEnd(&zs_);
}

void GzipInputBuffer::fail(const char* what, int code) {
    std::string msg = std::string("gzip input: ") + what;
    if (zs_.msg != nullptr) {
        msg += std::string(" (") + zs_.msg + ")";
    } else if (code != Z_OK) {
        msg += std::string(" (zlib code ") + std::to_string(code) + ")";
    }
    msg += std::string(" after ") + std::to_string(compressed_read_) + " compressed bytes";
    throw rdb::RdbError(rdb::ErrorKind::IoFailure, msg);
}

bool GzipInputBuffer::refill_input() {
    if (source_eof_) {
        return false;
    }
    source_.read(in_buf_.data(), static_cast<std::streamsize>(in_buf_.size()));
    const std::streamsize got = source_.gcount();
    if (source_.bad()) {
        fail("failed to read compressed stream", Z_OK);
    }
    if (got < static_cast<std::streamsize>(in_buf_.size())) {
        source_eof_ = true;
    }
    zs_.next_in = reinterpret_cast<Bytef*>(in_buf_.data());
    zs_.avail_in = static_cast<uInt>(got);
    compressed_read_ += static_cast<std::size_t>(got);
    return got > 0;
}

GzipInputBuffer::int_type GzipInputBuffer::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    for (;;) {
        if (zs_.avail_in == 0 && !refill_input()) {
            if (member_open_) {
                fail("truncated stream", Z_BUF_ERROR);
            }
            return traits_type::eof();
        }

        member_open_ = true;
        zs_.next_out = reinterpret_cast<Bytef*>(out_buf_.data());
        zs_.avail_out = static_cast<uInt>(out_buf_.size());

        const int rc = inflate(&zs_, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            fail("corrupt stream", rc);
        }

        const std::size_t produced = out_buf_.size() - zs_.avail_out;
        if (rc == Z_STREAM_END) {
            members_++;
            member_open_ = false;
            RDBDUMP_LOG_DEBUG("gzip member %zu done", members_);
            const int reset_rc = inflateReset(&zs_);
            if (reset_rc != Z_OK) {
                fail("inflateReset failed", reset_rc);
            }
        }

        if (produced > 0) {
            setg(out_buf_.data(), out_buf_.data(), out_buf_.data() + produced);
            return traits_type::to_int_type(*gptr());
        }
    }
}
}  // namespace rdbdump::gzip
