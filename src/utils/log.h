/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <cstdarg>

namespace rdbdump::log {
void set_debug_enabled(bool enabled);
bool debug_enabled();

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace rdbdump::log

#define RDBDUMP_LOG_DEBUG(fmt, ...)                    \
    do {                                               \
        if (::rdbdump::log::debug_enabled()) {         \
            ::rdbdump::log::debug(fmt, ##__VA_ARGS__); \
        }                                              \
    } while (0)
#define RDBDUMP_LOG_INFO(fmt, ...) ::rdbdump::log::info(fmt, ##__VA_ARGS__)
#define RDBDUMP_LOG_WARN(fmt, ...) ::rdbdump::log::warn(fmt, ##__VA_ARGS__)
#define RDBDUMP_LOG_ERROR(fmt, ...) ::rdbdump::log::error(fmt, ##__VA_ARGS__)
