/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "config/runtime_config.h"

#include "rdb/rdb_writer.h"
#include "utils/log.h"

#include <charconv>
#include <cstdlib>
#include <regex>
#include <string>

namespace rdbdump::config {
std::optional<unsigned> try_parse_major_version(std::string_view version) {
    static const std::regex semver(R"(^([0-9]+)(\.[0-9]+)?(\.[0-9]+)?)");
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(version.begin(), version.end(), m, semver)) {
        return std::nullopt;
    }
    const std::string_view major(&*m[1].first, static_cast<std::size_t>(m[1].length()));
    unsigned value = 0;
    const auto res = std::from_chars(major.data(), major.data() + major.size(), value);
    if (res.ec != std::errc() || value > rdb::kMaxRdbVersion) {
        return std::nullopt;
    }
    return value;
}

unsigned resolve_rdb_version(const char* env_value) {
    if (env_value == nullptr || *env_value == '\0') {
        return kDefaultRdbVersion;
    }
    const auto major = try_parse_major_version(env_value);
    if (!major.has_value()) {
        RDBDUMP_LOG_WARN(
            "Invalid value for %s: '%s', using %u", kRedisVersionEnv, env_value, kDefaultRdbVersion
        );
        return kDefaultRdbVersion;
    }
    return *major;
}

bool parse_flag(const char* env_value) {
    if (env_value == nullptr) {
        return false;
    }
    const std::string_view v(env_value);
    return !v.empty() && v != "0";
}

RuntimeConfig runtime_config_from(const char* redis_version, const char* debug) {
    RuntimeConfig cfg{};
    cfg.rdb_version = resolve_rdb_version(redis_version);
    cfg.debug = parse_flag(debug);
    return cfg;
}

RuntimeConfig load_runtime_config() {
    return runtime_config_from(std::getenv(kRedisVersionEnv), std::getenv(kDebugEnv));
}
}  // namespace rdbdump::config
