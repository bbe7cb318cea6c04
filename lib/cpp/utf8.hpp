// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace util {

// Value returned by DecodeUTF8 for a malformed sequence.
constexpr char32_t kInvalidCodePoint = 0xffffffff;

// Decode the code point at the start of a non-empty string. Stores the number
// of bytes consumed in *len, which is always at least 1. Malformed, overlong,
// surrogate, and out-of-range sequences consume one byte and return
// kInvalidCodePoint.
char32_t DecodeUTF8(std::string_view str, std::size_t *len);

// Return true if the string is entirely well-formed UTF-8.
bool IsValidUTF8(std::string_view str);

// Append the UTF-8 encoding of a code point.
void AppendUTF8(std::string *out, char32_t c);

} // namespace util
