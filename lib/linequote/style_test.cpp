// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/style.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string_view>

namespace linequote {
namespace {

TEST(StyleTest, NamesAreSorted) {
    const auto &names = StyleNames();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(names[0], "c");
    EXPECT_EQ(names[1], "c-maybe");
    EXPECT_EQ(names[2], "csv");
    EXPECT_EQ(names[3], "escape");
    EXPECT_EQ(names[4], "literal");
    EXPECT_EQ(names[5], "pcre");
    EXPECT_EQ(names[6], "shell");
    EXPECT_EQ(names[7], "shell-always");
}

TEST(StyleTest, Lookup) {
    EXPECT_EQ(LookupStyle("literal"), Style::Literal);
    EXPECT_EQ(LookupStyle("shell-always"), Style::ShellAlways);
    EXPECT_EQ(LookupStyle("shell"), Style::Shell);
    EXPECT_EQ(LookupStyle("escape"), Style::Escape);
    EXPECT_EQ(LookupStyle("c"), Style::C);
    EXPECT_EQ(LookupStyle("c-maybe"), Style::CMaybe);
    EXPECT_EQ(LookupStyle("pcre"), Style::PCRE);
    EXPECT_EQ(LookupStyle("csv"), Style::CSV);
}

TEST(StyleTest, LookupUnknown) {
    EXPECT_FALSE(LookupStyle("").has_value());
    EXPECT_FALSE(LookupStyle("C").has_value());
    EXPECT_FALSE(LookupStyle("shell_always").has_value());
    EXPECT_FALSE(LookupStyle("csv ").has_value());
}

TEST(StyleTest, NameRoundTrip) {
    for (std::string_view name : StyleNames()) {
        std::optional<Style> style = LookupStyle(name);
        ASSERT_TRUE(style.has_value()) << name;
        EXPECT_EQ(StyleName(*style), name);
        EXPECT_FALSE(StyleHelp(*style).empty()) << name;
    }
}

} // namespace
} // namespace linequote
