// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/quote.hpp"

#include "lib/cpp/utf8.hpp"
#include "lib/linequote/escape.hpp"

#include <stdexcept>

namespace linequote {

namespace {

// Characters which require quoting in a POSIX shell word. See POSIX.1-2008,
// Shell Command Language, 2.2 Quoting.
constexpr std::string_view kShellSpecial = "\t\n \"#$%&'()*;<=>?[\\`|~";

// Characters which form a trigraph when following "??".
constexpr std::string_view kTrigraphFinal = "!'()-/<=>";

// Characters in Python's string.whitespace.
constexpr std::string_view kWhitespace = " \t\n\r\v\f";

bool IsPrintableASCII(char c) {
    unsigned char u = c;
    return 0x20 <= u && u <= 0x7e;
}

bool IsWordChar(char c) {
    return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
           ('0' <= c && c <= '9') || c == '_';
}

bool IsTrigraphAt(std::string_view str, std::size_t pos) {
    return pos + 2 < str.size() && str[pos] == '?' && str[pos + 1] == '?' &&
           kTrigraphFinal.find(str[pos + 2]) != std::string_view::npos;
}

bool HasTrigraph(std::string_view str) {
    for (std::size_t i = 0; i < str.size(); i++) {
        if (IsTrigraphAt(str, i)) {
            return true;
        }
    }
    return false;
}

// Escape the character with a backslash if it is one of the given characters,
// and escape code points outside printable ASCII with octal escapes. Bytes
// which are not part of valid UTF-8 are escaped individually.
std::string EscapeCodePoints(std::string_view str,
                             std::string_view backslashed) {
    std::string out;
    out.reserve(str.size());
    while (!str.empty()) {
        const char c = str[0];
        std::size_t len = 1;
        if (backslashed.find(c) != std::string_view::npos) {
            out.push_back('\\');
            out.push_back(c);
        } else if (IsPrintableASCII(c)) {
            out.push_back(c);
        } else {
            char32_t cp = util::DecodeUTF8(str, &len);
            if (cp == util::kInvalidCodePoint) {
                cp = static_cast<unsigned char>(c);
            }
            AppendEscapeOctal(&out, cp);
        }
        str.remove_prefix(len);
    }
    return out;
}

} // namespace

std::string QuoteLiteral(std::string_view str) {
    return std::string(str);
}

std::string QuoteShellAlways(std::string_view str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('\'');
    for (const char c : str) {
        if (c == '\'') {
            out.append("'\\''");
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string QuoteShell(std::string_view str) {
    if (str.find_first_of(kShellSpecial) != std::string_view::npos) {
        return QuoteShellAlways(str);
    }
    return std::string(str);
}

std::string QuoteEscape(std::string_view str) {
    return EscapeCodePoints(str, " \\");
}

std::string QuoteC(std::string_view str) {
    std::string body = EscapeCodePoints(str, "\"\\");

    // Escape the second '?' in anything which would otherwise be a trigraph.
    // Matches do not overlap and are found left to right.
    std::string out;
    out.reserve(body.size() + 2);
    out.push_back('"');
    std::size_t i = 0;
    while (i < body.size()) {
        if (IsTrigraphAt(body, i)) {
            out.append("?\\?");
            out.push_back(body[i + 2]);
            i += 3;
        } else {
            out.push_back(body[i]);
            i++;
        }
    }
    out.push_back('"');
    return out;
}

std::string QuoteCMaybe(std::string_view str) {
    bool needs_quote = false;
    for (const char c : str) {
        if (c == '"' || c == '\\' || !IsPrintableASCII(c)) {
            needs_quote = true;
            break;
        }
    }
    if (needs_quote || HasTrigraph(str)) {
        return QuoteC(str);
    }
    return std::string(str);
}

std::string QuotePCRE(std::string_view str) {
    std::string out;
    out.reserve(str.size() * 2);
    while (!str.empty()) {
        std::size_t len;
        util::DecodeUTF8(str, &len);
        if (len != 1 || !IsWordChar(str[0])) {
            out.push_back('\\');
        }
        out.append(str.substr(0, len));
        str.remove_prefix(len);
    }
    return out;
}

std::string QuoteCSV(std::string_view str, const CSVOptions &options) {
    if (str.find('"') != std::string_view::npos) {
        std::string out;
        out.reserve(str.size() + 4);
        out.push_back('"');
        for (const char c : str) {
            if (c == '"') {
                out.push_back('"');
            }
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }
    bool needs_quote =
        str.find(options.field_separator) != std::string_view::npos ||
        str.find(options.record_separator) != std::string_view::npos ||
        (!str.empty() &&
         (kWhitespace.find(str.front()) != std::string_view::npos ||
          kWhitespace.find(str.back()) != std::string_view::npos));
    if (needs_quote) {
        std::string out;
        out.reserve(str.size() + 2);
        out.push_back('"');
        out.append(str);
        out.push_back('"');
        return out;
    }
    return std::string(str);
}

std::string Quote(std::string_view str, Style style,
                  const CSVOptions &options) {
    switch (style) {
    case Style::Literal:
        return QuoteLiteral(str);
    case Style::ShellAlways:
        return QuoteShellAlways(str);
    case Style::Shell:
        return QuoteShell(str);
    case Style::Escape:
        return QuoteEscape(str);
    case Style::C:
        return QuoteC(str);
    case Style::CMaybe:
        return QuoteCMaybe(str);
    case Style::PCRE:
        return QuotePCRE(str);
    case Style::CSV:
        return QuoteCSV(str, options);
    }
    throw std::logic_error("invalid style");
}

} // namespace linequote
