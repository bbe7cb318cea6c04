// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <fmt/format.h>

namespace util {

// Logging severity levels.
enum class LogLevel {
    Error,
    Warning,
};

// Log a message to stderr. The level is highlighted if stderr is a terminal.
void LogV(LogLevel level, fmt::string_view format, fmt::format_args args);

// Print an error message.
template <typename... T>
void Err(fmt::format_string<T...> format, T &&...args) {
    LogV(LogLevel::Error, format, fmt::make_format_args(args...));
}

// Print a warning message.
template <typename... T>
void Warn(fmt::format_string<T...> format, T &&...args) {
    LogV(LogLevel::Warning, format, fmt::make_format_args(args...));
}

} // namespace util
