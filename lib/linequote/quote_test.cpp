// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/quote.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace linequote {
namespace {

using namespace std::string_literals;

// Parse a word made of single-quoted strings and backslash-escaped
// characters, the way a POSIX shell does.
std::string ParseShellWord(std::string_view word) {
    std::string out;
    std::size_t i = 0;
    while (i < word.size()) {
        char c = word[i++];
        if (c == '\'') {
            std::size_t end = word.find('\'', i);
            EXPECT_NE(end, std::string_view::npos) << "unterminated quote";
            if (end == std::string_view::npos) {
                break;
            }
            out.append(word.substr(i, end - i));
            i = end + 1;
        } else if (c == '\\' && i < word.size()) {
            out.push_back(word[i++]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Parse a single CSV field with double quote doubling.
std::string ParseCSVField(std::string_view field) {
    if (field.empty() || field.front() != '"') {
        return std::string(field);
    }
    std::string out;
    for (std::size_t i = 1; i + 1 < field.size(); i++) {
        if (field[i] == '"') {
            i++;
        }
        out.push_back(field[i]);
    }
    return out;
}

const std::vector<std::string> kSamples = {
    "",
    "plain",
    "it's",
    "a b",
    "tab\there",
    "back\\slash",
    "quote\"d",
    "he said \"hi\"",
    "a,b",
    " leading",
    "trailing ",
    "??!",
    "???=",
    "''",
    "$HOME",
    "caf\xc3\xa9",
    "nul\0byte"s,
};

TEST(QuoteTest, Literal) {
    for (const std::string &s : kSamples) {
        EXPECT_EQ(QuoteLiteral(s), s);
    }
}

TEST(QuoteTest, ShellAlways) {
    EXPECT_EQ(QuoteShellAlways("it's"), "'it'\\''s'");
    EXPECT_EQ(QuoteShellAlways(""), "''");
    EXPECT_EQ(QuoteShellAlways("plain"), "'plain'");
    EXPECT_EQ(QuoteShellAlways("a\\b"), "'a\\b'");
}

TEST(QuoteTest, ShellAlwaysRoundTrip) {
    for (const std::string &s : kSamples) {
        EXPECT_EQ(ParseShellWord(QuoteShellAlways(s)), s) << s;
    }
}

TEST(QuoteTest, Shell) {
    EXPECT_EQ(QuoteShell("plain"), "plain");
    EXPECT_EQ(QuoteShell(""), "");
    EXPECT_EQ(QuoteShell("file.txt"), "file.txt");
    EXPECT_EQ(QuoteShell("a/b-c_d+e@f:g,h.i"), "a/b-c_d+e@f:g,h.i");
    EXPECT_EQ(QuoteShell("it's"), "'it'\\''s'");
    EXPECT_EQ(QuoteShell("a b"), "'a b'");
}

TEST(QuoteTest, ShellSpecialCharacters) {
    const std::string_view special = "\t\n \"#$%&'()*;<=>?[\\`|~";
    for (char c : special) {
        std::string s = "ab";
        s.insert(s.begin() + 1, c);
        EXPECT_EQ(QuoteShell(s), QuoteShellAlways(s)) << s;
    }
}

TEST(QuoteTest, Escape) {
    EXPECT_EQ(QuoteEscape(""), "");
    EXPECT_EQ(QuoteEscape("plain"), "plain");
    EXPECT_EQ(QuoteEscape("a b"), "a\\ b");
    EXPECT_EQ(QuoteEscape("a\\b"), "a\\\\b");
    EXPECT_EQ(QuoteEscape("tab\there"), "tab\\there");
    EXPECT_EQ(QuoteEscape("\x01"), "\\001");
    EXPECT_EQ(QuoteEscape("\x7f"), "\\177");
    EXPECT_EQ(QuoteEscape("nul\0"s), "nul\\000");
    EXPECT_EQ(QuoteEscape("\"'?"), "\"'?");
    EXPECT_EQ(QuoteEscape("caf\xc3\xa9"), "caf\\351");
    EXPECT_EQ(QuoteEscape("\xe4\xb8\xad"), "\\47055");
    EXPECT_EQ(QuoteEscape("bad\xff"), "bad\\377");
}

TEST(QuoteTest, C) {
    EXPECT_EQ(QuoteC(""), "\"\"");
    EXPECT_EQ(QuoteC("plain"), "\"plain\"");
    EXPECT_EQ(QuoteC("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(QuoteC("line\n"), "\"line\\n\"");
    EXPECT_EQ(QuoteC("bell\a"), "\"bell\\a\"");
    EXPECT_EQ(QuoteC("\x1b[0m"), "\"\\033[0m\"");
    EXPECT_EQ(QuoteC("it's"), "\"it's\"");
    EXPECT_EQ(QuoteC("caf\xc3\xa9"), "\"caf\\351\"");
    EXPECT_EQ(QuoteC("\xc3"), "\"\\303\"");
}

TEST(QuoteTest, CTrigraphs) {
    EXPECT_EQ(QuoteC("??!"), "\"?\\?!\"");
    EXPECT_EQ(QuoteC("??="), "\"?\\?=\"");
    EXPECT_EQ(QuoteC("??'"), "\"?\\?'\"");
    EXPECT_EQ(QuoteC("??("), "\"?\\?(\"");
    EXPECT_EQ(QuoteC("??)"), "\"?\\?)\"");
    EXPECT_EQ(QuoteC("??-"), "\"?\\?-\"");
    EXPECT_EQ(QuoteC("??/"), "\"?\\?/\"");
    EXPECT_EQ(QuoteC("??<"), "\"?\\?<\"");
    EXPECT_EQ(QuoteC("??>"), "\"?\\?>\"");
    EXPECT_EQ(QuoteC("??a"), "\"??a\"");
    EXPECT_EQ(QuoteC("??"), "\"??\"");
    EXPECT_EQ(QuoteC("???="), "\"??\\?=\"");
    EXPECT_EQ(QuoteC("??!??!"), "\"?\\?!?\\?!\"");
    EXPECT_EQ(QuoteC("what??!"), "\"what?\\?!\"");
}

TEST(QuoteTest, CNeverProducesTrigraph) {
    for (const std::string &s : kSamples) {
        std::string q = QuoteC(s);
        for (char c : std::string_view{"!'()-/<=>"}) {
            std::string trigraph = "??";
            trigraph.push_back(c);
            EXPECT_EQ(q.find(trigraph), std::string::npos) << s;
        }
    }
}

TEST(QuoteTest, CMaybe) {
    EXPECT_EQ(QuoteCMaybe(""), "");
    EXPECT_EQ(QuoteCMaybe("plain"), "plain");
    EXPECT_EQ(QuoteCMaybe("it's ok?"), "it's ok?");
    EXPECT_EQ(QuoteCMaybe("a\"b"), "\"a\\\"b\"");
    EXPECT_EQ(QuoteCMaybe("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(QuoteCMaybe("tab\there"), "\"tab\\there\"");
    EXPECT_EQ(QuoteCMaybe("??!"), "\"?\\?!\"");
    EXPECT_EQ(QuoteCMaybe("??a"), "??a");
}

TEST(QuoteTest, CMaybeAgreesWithC) {
    for (const std::string &s : kSamples) {
        std::string maybe = QuoteCMaybe(s);
        if (maybe == s) {
            EXPECT_EQ(QuoteC(s), "\"" + s + "\"") << s;
        } else {
            EXPECT_EQ(maybe, QuoteC(s)) << s;
        }
    }
}

TEST(QuoteTest, PCRE) {
    EXPECT_EQ(QuotePCRE(""), "");
    EXPECT_EQ(QuotePCRE("abc_XYZ_019"), "abc_XYZ_019");
    EXPECT_EQ(QuotePCRE("a.b"), "a\\.b");
    EXPECT_EQ(QuotePCRE("(x)*"), "\\(x\\)\\*");
    EXPECT_EQ(QuotePCRE("a b"), "a\\ b");
    EXPECT_EQ(QuotePCRE("\\"), "\\\\");
    EXPECT_EQ(QuotePCRE("caf\xc3\xa9"), "caf\\\xc3\xa9");
    EXPECT_EQ(QuotePCRE("\xff"), "\\\xff");
}

TEST(QuoteTest, CSV) {
    EXPECT_EQ(QuoteCSV(""), "");
    EXPECT_EQ(QuoteCSV("plain"), "plain");
    EXPECT_EQ(QuoteCSV("a,b"), "\"a,b\"");
    EXPECT_EQ(QuoteCSV("he said \"hi\""), "\"he said \"\"hi\"\"\"");
    EXPECT_EQ(QuoteCSV("\""), "\"\"\"\"");
    EXPECT_EQ(QuoteCSV(" leading"), "\" leading\"");
    EXPECT_EQ(QuoteCSV("trailing\t"), "\"trailing\t\"");
    EXPECT_EQ(QuoteCSV("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(QuoteCSV("in side"), "in side");
}

TEST(QuoteTest, CSVSeparators) {
    CSVOptions options;
    options.field_separator = ";";
    options.record_separator = "\r\n";
    EXPECT_EQ(QuoteCSV("a,b", options), "a,b");
    EXPECT_EQ(QuoteCSV("a;b", options), "\"a;b\"");
    EXPECT_EQ(QuoteCSV("a\r\nb", options), "\"a\r\nb\"");
    EXPECT_EQ(QuoteCSV("a\nb", options), "a\nb");
}

TEST(QuoteTest, CSVRoundTrip) {
    for (const std::string &s : kSamples) {
        EXPECT_EQ(ParseCSVField(QuoteCSV(s)), s) << s;
    }
}

TEST(QuoteTest, Dispatch) {
    const std::string s = "it's \"x\"";
    EXPECT_EQ(Quote(s, Style::Literal), QuoteLiteral(s));
    EXPECT_EQ(Quote(s, Style::ShellAlways), QuoteShellAlways(s));
    EXPECT_EQ(Quote(s, Style::Shell), QuoteShell(s));
    EXPECT_EQ(Quote(s, Style::Escape), QuoteEscape(s));
    EXPECT_EQ(Quote(s, Style::C), QuoteC(s));
    EXPECT_EQ(Quote(s, Style::CMaybe), QuoteCMaybe(s));
    EXPECT_EQ(Quote(s, Style::PCRE), QuotePCRE(s));
    EXPECT_EQ(Quote(s, Style::CSV), QuoteCSV(s));

    CSVOptions options;
    options.field_separator = "|";
    EXPECT_EQ(Quote("a|b", Style::CSV, options), "\"a|b\"");
}

} // namespace
} // namespace linequote
