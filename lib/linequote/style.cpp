// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/style.hpp"

#include <stdexcept>

namespace linequote {

namespace {

struct StyleInfo {
    char name[16];
    Style style;
    const char *help;
};

// Sorted by name.
const StyleInfo kStyles[kStyleCount] = {
    {"c", Style::C,
     "Quote for a C string literal. Escape non-printable characters, double "
     "quotes, backslashes, and trigraphs, and surround the result with double "
     "quotes."},
    {"c-maybe", Style::CMaybe,
     "Quote for a C string literal, like 'c', but only if something needs to "
     "be escaped. Otherwise the line is unchanged."},
    {"csv", Style::CSV,
     "Quote for a CSV field. Double any double quotes and surround the result "
     "with double quotes if the line contains a double quote, a field "
     "separator, or a record separator, or if it begins or ends with "
     "whitespace."},
    {"escape", Style::Escape,
     "Escape non-printable characters, spaces, and backslashes."},
    {"literal", Style::Literal, "Do not quote the line."},
    {"pcre", Style::PCRE,
     "Escape every character other than letters, digits, and underscores for "
     "a Perl Compatible Regular Expression."},
    {"shell", Style::Shell,
     "Quote for a POSIX shell, like 'shell-always', but only if the line "
     "contains characters special to the shell."},
    {"shell-always", Style::ShellAlways,
     "Quote for a POSIX shell. Escape single quotes, and surround the result "
     "with single quotes."},
};

const StyleInfo &GetInfo(Style style) {
    for (const StyleInfo &info : kStyles) {
        if (info.style == style) {
            return info;
        }
    }
    throw std::logic_error("invalid style");
}

} // namespace

std::optional<Style> LookupStyle(std::string_view name) {
    for (const StyleInfo &info : kStyles) {
        if (name == info.name) {
            return info.style;
        }
    }
    return std::nullopt;
}

const std::array<std::string_view, kStyleCount> &StyleNames() {
    static const std::array<std::string_view, kStyleCount> names = [] {
        std::array<std::string_view, kStyleCount> r;
        for (std::size_t i = 0; i < kStyleCount; i++) {
            r[i] = kStyles[i].name;
        }
        return r;
    }();
    return names;
}

std::string_view StyleName(Style style) {
    return GetInfo(style).name;
}

std::string_view StyleHelp(Style style) {
    return GetInfo(style).help;
}

} // namespace linequote
