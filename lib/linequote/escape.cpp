// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/escape.hpp"

#include "lib/cpp/utf8.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace linequote {

namespace {

struct SimpleEscapeEntry {
    char32_t c;
    char text[3];
};

// Simple escape sequences from C and C++ character literals.
constexpr SimpleEscapeEntry kSimpleEscapes[] = {
    {'\a', "\\a"}, {'\b', "\\b"},  {'\t', "\\t"},  {'\n', "\\n"},
    {'\v', "\\v"}, {'\f', "\\f"},  {'\r', "\\r"},  {'"', "\\\""},
    {'\'', "\\'"}, {'?', "\\?"}, {'\\', "\\\\"},
};

struct Range {
    char32_t first;
    char32_t last;
};

// Non-printable code points, sorted. Each range holds only Cc, Cf, Cs, Co, Cn,
// Zs, Zl, or Zp code points.
constexpr Range kNonPrintable[] = {
#include "lib/linequote/printable_table.inc"
};

} // namespace

bool IsPrintable(char32_t c) {
    if (c > 0x10ffff) {
        return false;
    }
    // First range which ends at or after c.
    const Range *it = std::lower_bound(
        std::begin(kNonPrintable), std::end(kNonPrintable), c,
        [](const Range &r, char32_t value) -> bool { return r.last < value; });
    return it == std::end(kNonPrintable) || c < it->first;
}

std::string_view SimpleEscape(char32_t c) {
    for (const SimpleEscapeEntry &e : kSimpleEscapes) {
        if (e.c == c) {
            return e.text;
        }
    }
    return std::string_view();
}

void AppendEscapeOctal(std::string *out, char32_t c) {
    std::string_view simple = SimpleEscape(c);
    if (!simple.empty()) {
        out->append(simple);
        return;
    }
    fmt::format_to(std::back_inserter(*out), "\\{:03o}",
                   static_cast<std::uint32_t>(c));
}

void AppendEscapeHexadecimal(std::string *out, char32_t c) {
    std::string_view simple = SimpleEscape(c);
    if (!simple.empty()) {
        out->append(simple);
        return;
    }
    fmt::format_to(std::back_inserter(*out), "\\x{:02X}",
                   static_cast<std::uint32_t>(c));
}

std::string EscapeOctal(char32_t c) {
    std::string out;
    AppendEscapeOctal(&out, c);
    return out;
}

std::string EscapeHexadecimal(char32_t c) {
    std::string out;
    AppendEscapeHexadecimal(&out, c);
    return out;
}

std::string EscapeNonPrintable(char32_t c, EscapeMode mode) {
    std::string out;
    if (IsPrintable(c)) {
        util::AppendUTF8(&out, c);
        return out;
    }
    switch (mode) {
    case EscapeMode::Octal:
        AppendEscapeOctal(&out, c);
        break;
    case EscapeMode::Hexadecimal:
        AppendEscapeHexadecimal(&out, c);
        break;
    }
    return out;
}

} // namespace linequote
