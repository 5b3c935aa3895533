/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdbdump.h"

#include "gzip/gzip_streambuf.h"
#include "utils/log.h"

#include <chrono>
#include <string>

namespace rdbdump {

static std::string to_hex_u64(std::uint64_t v) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.resize(18);
    out[0] = '0';
    out[1] = 'x';
    for (int i = 0; i < 16; i++) {
        const int shift = 60 - (i * 4);
        out[2 + i] = hexdig[(v >> shift) & 0xFu];
    }
    return out;
}

DumpResult RdbDump::ConvertStream(std::istream& in, std::ostream& out, const DumpOptions& opt) {
    log::set_debug_enabled(opt.debug);
    const auto t0 = std::chrono::steady_clock::now();
    rdb::RdbWriter writer(out, opt.rdb_version);

    if (opt.gzipped) {
        gzip::GzipInputBuffer inflater(in);
        std::istream gz_in(&inflater);
        gz_in.exceptions(std::ios::badbit);
        writer.write_stream(gz_in);
        RDBDUMP_LOG_DEBUG(
            "gzip: %zu compressed bytes, %zu member(s)", inflater.compressed_bytes_read(),
            inflater.members_decoded()
        );
    } else {
        writer.write_stream(in);
    }

    DumpResult res{};
    res.records = writer.counts();
    res.bytes_written = writer.bytes_written();
    res.checksum = writer.checksum();

    if (opt.debug) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0
        )
                            .count();
        RDBDUMP_LOG_INFO(
            "REDIS%04u: records=%llu (strings=%llu sets=%llu hashes=%llu) bytes=%llu crc64=%s "
            "time=%lldms",
            opt.rdb_version, static_cast<unsigned long long>(res.records.total()),
            static_cast<unsigned long long>(res.records.strings),
            static_cast<unsigned long long>(res.records.sets),
            static_cast<unsigned long long>(res.records.hashes),
            static_cast<unsigned long long>(res.bytes_written), to_hex_u64(res.checksum).c_str(),
            static_cast<long long>(ms)
        );
    }
    return res;
}

}  // namespace rdbdump
