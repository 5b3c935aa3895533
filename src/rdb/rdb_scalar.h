/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <toml.hpp>

#include <string>

namespace rdbdump::rdb {
using TomlValue = toml::ordered_value;

// Canonical text of a scalar as stored in Redis. Arrays and tables have no
// textual form and raise UnsupportedScalarKind.
std::string stringify_scalar(const TomlValue& value);

// Shortest round-trip decimal, never in exponent form ("30", "0.1").
std::string format_float(double v);
}  // namespace rdbdump::rdb
