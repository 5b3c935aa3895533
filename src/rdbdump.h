/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include "config/runtime_config.h"
#include "rdb/rdb_writer.h"

#include <cstdint>
#include <istream>
#include <ostream>

namespace rdbdump {

struct DumpOptions {
    unsigned rdb_version = config::kDefaultRdbVersion;
    bool gzipped = false;
    bool debug = false;
};

struct DumpResult {
    rdb::RecordCounts records{};
    std::uint64_t bytes_written = 0;
    std::uint64_t checksum = 0;
};

class RdbDump {
   public:
    // One pass: TOML text from `in`, RDB bytes to `out`. Throws rdb::RdbError
    // on the first failure, leaving whatever was already written in `out`.
    static DumpResult ConvertStream(std::istream& in, std::ostream& out, const DumpOptions& opt = {});
};

}  // namespace rdbdump
