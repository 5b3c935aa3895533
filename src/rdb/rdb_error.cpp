/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#include "rdb/rdb_error.h"

namespace rdbdump::rdb {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedFragment:
            return "MalformedFragment";
        case ErrorKind::InvalidKeyedRecord:
            return "InvalidKeyedRecord";
        case ErrorKind::UnsupportedScalarKind:
            return "UnsupportedScalarKind";
        case ErrorKind::IoFailure:
            return "IOFailure";
    }
    return "Unknown";
}

RdbError::RdbError(ErrorKind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}

ErrorKind RdbError::kind() const noexcept {
    return kind_;
}

}  // namespace rdbdump::rdb
