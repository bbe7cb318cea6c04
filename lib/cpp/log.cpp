// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/log.hpp"

#include <cstdio>
#include <iterator>
#include <string_view>

#include <unistd.h>

namespace util {

namespace {

bool UseColor() {
    static const bool use_color = isatty(fileno(stderr)) != 0;
    return use_color;
}

} // namespace

void LogV(LogLevel level, fmt::string_view format, fmt::format_args args) {
    std::string_view color, leveltext;
    switch (level) {
    case LogLevel::Error:
        color = "31";
        leveltext = "Error";
        break;
    case LogLevel::Warning:
        color = "33";
        leveltext = "Warning";
        break;
    }
    auto buf = fmt::memory_buffer();
    auto out = std::back_inserter(buf);
    if (UseColor()) {
        fmt::format_to(out, "\x1b[{}m{}\x1b[0m: ", color, leveltext);
    } else {
        fmt::format_to(out, "{}: ", leveltext);
    }
    fmt::vformat_to(out, format, args);
    buf.push_back('\n');
    std::fwrite(buf.data(), 1, buf.size(), stderr);
}

} // namespace util
