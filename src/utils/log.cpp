/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "log.h"
#include <cstdio>

// stdout carries the dump, every level goes to stderr.
static void vprint(const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, stderr);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

namespace rdbdump::log {
namespace {
bool g_debug = false;
}  // namespace

void set_debug_enabled(bool enabled) {
    g_debug = enabled;
}

bool debug_enabled() {
    return g_debug;
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[DEBUG] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("", fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace rdbdump::log
