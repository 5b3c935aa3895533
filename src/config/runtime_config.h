/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <optional>
#include <string_view>

namespace rdbdump::config {
constexpr unsigned kDefaultRdbVersion = 7;
constexpr const char* kRedisVersionEnv = "REDIS_VERSION";
constexpr const char* kDebugEnv = "RDBDUMP_DEBUG";

struct RuntimeConfig {
    unsigned rdb_version = kDefaultRdbVersion;
    bool debug = false;
};

// Major component of "7", "7.2" or "7.2.4". Anything after the matched prefix
// is ignored ("7.2.4-rc1" -> 7).
std::optional<unsigned> try_parse_major_version(std::string_view version);
unsigned resolve_rdb_version(const char* env_value);
bool parse_flag(const char* env_value);

RuntimeConfig runtime_config_from(const char* redis_version, const char* debug);
RuntimeConfig load_runtime_config();
}  // namespace rdbdump::config
