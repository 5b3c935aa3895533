/**
 * Copyright (c) 2026 Cr4nkSt4r - rdbdump
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rdbdump::rdb {

enum class ErrorKind {
    MalformedFragment,
    InvalidKeyedRecord,
    UnsupportedScalarKind,
    IoFailure,
};

std::string_view error_kind_name(ErrorKind kind);

// Every failure of a conversion pass is fatal and surfaces as this type.
class RdbError : public std::runtime_error {
   public:
    RdbError(ErrorKind kind, const std::string& msg);

    ErrorKind kind() const noexcept;

   private:
    ErrorKind kind_;
};

}  // namespace rdbdump::rdb
