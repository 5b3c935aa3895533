/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_scalar.h"

#include "rdb/rdb_error.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace rdbdump::rdb {
namespace {
std::string format_date(const toml::local_date& date) {
    std::ostringstream oss;
    oss << date;
    return oss.str();
}

std::string format_time(const toml::local_time& time) {
    char buf[16]{};
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", int(time.hour), int(time.minute), int(time.second));
    std::string out(buf);

    const long nanos = long(time.millisecond) * 1000000L + long(time.microsecond) * 1000L + long(time.nanosecond);
    if (nanos != 0) {
        char frac[16]{};
        std::snprintf(frac, sizeof(frac), "%09ld", nanos);
        std::string digits(frac);
        digits.erase(digits.find_last_not_of('0') + 1);
        out += '.';
        out += digits;
    }
    return out;
}

std::string format_offset(const toml::time_offset& offset) {
    const int minutes = int(offset.hour) * 60 + int(offset.minute);
    const int abs_minutes = std::abs(minutes);
    char buf[16]{};
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", minutes < 0 ? '-' : '+', abs_minutes / 60, abs_minutes % 60);
    return std::string(buf);
}

// toml11 keeps only the numeric offset, so the source literal decides between
// "Z" and "+00:00". Values without a source location are written as "Z".
bool zero_offset_written_as_z(const TomlValue& value) {
    const toml::source_location loc = value.location();
    if (!loc.is_ok() || loc.length() == 0 || loc.first_column_number() == 0) {
        return true;
    }
    const std::string_view line = loc.first_line();
    const std::size_t first = loc.first_column_number() - 1;
    if (first >= line.size()) {
        return true;
    }
    // One extra character on each side tolerates either column origin.
    const std::size_t begin = first == 0 ? 0 : first - 1;
    const std::string_view literal = line.substr(begin, loc.length() + 2);
    return literal.find_first_of("Zz") != std::string_view::npos;
}

std::string format_offset_datetime(const TomlValue& value) {
    const toml::offset_datetime& dt = value.as_offset_datetime();
    std::string out = format_date(dt.date) + 'T' + format_time(dt.time);
    if (dt.offset.hour == 0 && dt.offset.minute == 0 && zero_offset_written_as_z(value)) {
        return out + 'Z';
    }
    return out + format_offset(dt.offset);
}
}  // namespace

std::string format_float(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-inf" : "inf";
    }

    // Shortest round-trip digits come back as "d.ddde[+-]xx"; spell them out.
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::scientific);
    if (res.ec != std::errc()) {
        throw std::runtime_error(std::string("Failed to format float value"));
    }
    const std::string_view sci(buf.data(), std::size_t(res.ptr - buf.data()));
    const std::size_t e_pos = sci.find('e');
    if (e_pos == std::string_view::npos) {
        throw std::runtime_error(std::string("Unexpected float text: ") + std::string(sci));
    }

    std::string out;
    std::string_view mantissa = sci.substr(0, e_pos);
    if (!mantissa.empty() && mantissa.front() == '-') {
        out += '-';
        mantissa.remove_prefix(1);
    }
    std::string digits;
    for (char c : mantissa) {
        if (c != '.') {
            digits += c;
        }
    }

    std::string_view exp_text = sci.substr(e_pos + 1);
    if (!exp_text.empty() && exp_text.front() == '+') {
        exp_text.remove_prefix(1);
    }
    int exponent = 0;
    const auto exp_res = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
    if (exp_res.ec != std::errc()) {
        throw std::runtime_error(std::string("Unexpected float exponent: ") + std::string(sci));
    }

    // Number of digits before the decimal point.
    const long point = long(exponent) + 1;
    const long ndigits = long(digits.size());
    if (point >= ndigits) {
        out += digits;
        out.append(std::size_t(point - ndigits), '0');
    } else if (point > 0) {
        out.append(digits, 0, std::size_t(point));
        out += '.';
        out.append(digits, std::size_t(point), std::string::npos);
    } else {
        out += "0.";
        out.append(std::size_t(-point), '0');
        out += digits;
    }
    return out;
}

std::string stringify_scalar(const TomlValue& value) {
    switch (value.type()) {
        case toml::value_t::integer:
            return std::to_string(value.as_integer());
        case toml::value_t::floating:
            return format_float(value.as_floating());
        case toml::value_t::boolean:
            return value.as_boolean() ? "true" : "false";
        case toml::value_t::string:
            return value.as_string();
        case toml::value_t::offset_datetime:
            return format_offset_datetime(value);
        case toml::value_t::local_datetime:
            return format_date(value.as_local_datetime().date) + 'T'
                + format_time(value.as_local_datetime().time);
        case toml::value_t::local_date:
            return format_date(value.as_local_date());
        case toml::value_t::local_time:
            return format_time(value.as_local_time());
        case toml::value_t::array:
        case toml::value_t::table:
        case toml::value_t::empty:
            break;
    }
    throw RdbError(
        ErrorKind::UnsupportedScalarKind,
        std::string("Value of kind '") + toml::to_string(value.type())
            + "' has no string form (nested arrays and tables are not supported)"
    );
}
}  // namespace rdbdump::rdb
