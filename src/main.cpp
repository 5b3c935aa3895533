/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "config/runtime_config.h"
#include "rdb/rdb_error.h"
#include "rdbdump.h"
#include "utils/log.h"

#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#if defined(_WIN32)
#include <fcntl.h>
#include <io.h>
#endif

struct Settings {
    bool gzipped = false;
};

static void print_usage() {
    RDBDUMP_LOG_INFO(
        "rdbdump - stream a TOML file into Redis RDB format\n\n" \
        "Usage:\n" \
        "    rdbdump [--gzipped] < input.toml > dump.rdb\n\n" \
        "Options:\n" \
        "    -g, --gzipped  input on stdin is gzip compressed\n" \
        "    -h, --help     print this help\n\n" \
        "Environment:\n" \
        "    REDIS_VERSION  version written in the header, major part only (default 7)\n" \
        "    RDBDUMP_DEBUG  set to 1 for per-record logging on stderr\n"
    );
}

static void set_binary_stdio() {
#if defined(_WIN32)
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif
}

int main(int argc, char** argv) {
    Settings settings;
    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "-g" || arg == "--gzipped") {
            settings.gzipped = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        RDBDUMP_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        print_usage();
        return 2;
    }

    const auto cfg = rdbdump::config::load_runtime_config();
    rdbdump::log::set_debug_enabled(cfg.debug);
    set_binary_stdio();
    std::ios::sync_with_stdio(false);

    rdbdump::DumpOptions opt{};
    opt.rdb_version = cfg.rdb_version;
    opt.gzipped = settings.gzipped;
    opt.debug = cfg.debug;

    try {
        rdbdump::RdbDump::ConvertStream(std::cin, std::cout, opt);
    } catch (const rdbdump::rdb::RdbError& e) {
        RDBDUMP_LOG_ERROR(
            "%s: %s", std::string(rdbdump::rdb::error_kind_name(e.kind())).c_str(), e.what()
        );
        return 1;
    } catch (const std::exception& e) {
        RDBDUMP_LOG_ERROR("Failed: %s", e.what());
        return 1;
    }
    return 0;
}
