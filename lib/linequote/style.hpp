// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace linequote {

// A quoting style. Each style has exactly one quoting function.
enum class Style {
    Literal,
    ShellAlways,
    Shell,
    Escape,
    C,
    CMaybe,
    PCRE,
    CSV,
};

constexpr std::size_t kStyleCount = 8;

// Find a style by name, such as "shell-always".
std::optional<Style> LookupStyle(std::string_view name);

// Return the names of all styles, in sorted order.
const std::array<std::string_view, kStyleCount> &StyleNames();

// Return the name of a style.
std::string_view StyleName(Style style);

// Return a one-line description of a style, for help text.
std::string_view StyleHelp(Style style);

} // namespace linequote
