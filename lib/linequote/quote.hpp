// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include "lib/linequote/style.hpp"

#include <string>
#include <string_view>

namespace linequote {

// Separators recognized by the CSV quoting style.
struct CSVOptions {
    std::string field_separator = ",";
    std::string record_separator = "\n";
};

// Do not quote the string.
std::string QuoteLiteral(std::string_view str);

// Quote the string for a POSIX shell, in all cases. Each single quote becomes
// '\'' and the result is surrounded with single quotes.
std::string QuoteShellAlways(std::string_view str);

// Quote the string for a POSIX shell if it contains any character which is
// special to the shell. Otherwise, return it unchanged.
std::string QuoteShell(std::string_view str);

// Escape spaces and backslashes with a backslash, and octal-escape every code
// point outside the printable ASCII range. Invalid UTF-8 bytes are escaped
// individually.
std::string QuoteEscape(std::string_view str);

// Quote the string as a C string literal. Double quotes, backslashes, code
// points outside the printable ASCII range, and would-be trigraphs are
// escaped.
std::string QuoteC(std::string_view str);

// Quote the string as a C string literal if anything in it needs escaping.
// Otherwise, return it unchanged.
std::string QuoteCMaybe(std::string_view str);

// Escape every character which is not an ASCII letter, digit, or underscore
// for a Perl Compatible Regular Expression.
std::string QuotePCRE(std::string_view str);

// Quote the string as a CSV field, if necessary.
std::string QuoteCSV(std::string_view str,
                     const CSVOptions &options = CSVOptions{});

// Quote the string with the given style.
std::string Quote(std::string_view str, Style style,
                  const CSVOptions &options = CSVOptions{});

} // namespace linequote
