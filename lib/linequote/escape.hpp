// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <string>
#include <string_view>

namespace linequote {

// Numeric form used for characters without a simple escape sequence.
enum class EscapeMode {
    Octal,
    Hexadecimal,
};

// Return true if the character is printable: not a control, format,
// surrogate, private-use, or unassigned-plane character, and not a separator
// other than ASCII space. This does not depend on the locale.
bool IsPrintable(char32_t c);

// Return the simple escape sequence for a character, such as "\\n" for
// newline, or an empty string if there is none.
std::string_view SimpleEscape(char32_t c);

// Append the simple escape sequence for the character, or an octal escape
// sequence with at least three digits.
void AppendEscapeOctal(std::string *out, char32_t c);

// Append the simple escape sequence for the character, or a hexadecimal
// escape sequence with at least two uppercase digits.
void AppendEscapeHexadecimal(std::string *out, char32_t c);

// Escape the character with a simple or octal escape sequence.
std::string EscapeOctal(char32_t c);

// Escape the character with a simple or hexadecimal escape sequence.
std::string EscapeHexadecimal(char32_t c);

// Escape the character if it is not printable. Printable characters are
// returned as UTF-8.
std::string EscapeNonPrintable(char32_t c, EscapeMode mode);

} // namespace linequote
