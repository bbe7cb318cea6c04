// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/error.hpp"

#include <fmt/format.h>

#include <string.h>

namespace util {

namespace {

constexpr std::size_t kErrorBufSize = 1024;

// strerror_r has two incompatible signatures. Overloading on the return type
// picks the right conversion without checking feature macros.
[[maybe_unused]] std::string StrErrorResult(int r, const char *buf) {
    if (r != 0) {
        return std::string();
    }
    return buf;
}

[[maybe_unused]] std::string StrErrorResult(const char *p, const char *buf) {
    (void)buf;
    if (p == nullptr) {
        return std::string();
    }
    return p;
}

} // namespace

std::string StrError(int errorcode) {
    char buf[kErrorBufSize];
    buf[0] = '\0';
    return StrErrorResult(strerror_r(errorcode, buf, sizeof(buf)), buf);
}

Error IOError(std::string_view file, const char *op, int errorcode) {
    return Error(fmt::format("{} {}: {}", op, file, StrError(errorcode)));
}

Error InvalidUTF8(std::string_view file) {
    return Error(fmt::format("read {}: invalid UTF-8 text", file));
}

} // namespace util
