// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/utf8.hpp"

namespace util {

char32_t DecodeUTF8(std::string_view str, std::size_t *len) {
    *len = 1;
    unsigned c0 = static_cast<unsigned char>(str[0]);
    if (c0 < 0x80) {
        return c0;
    }
    std::size_t n;
    char32_t cp, min;
    if ((c0 & 0xe0) == 0xc0) {
        n = 2;
        cp = c0 & 0x1f;
        min = 0x80;
    } else if ((c0 & 0xf0) == 0xe0) {
        n = 3;
        cp = c0 & 0x0f;
        min = 0x800;
    } else if ((c0 & 0xf8) == 0xf0) {
        n = 4;
        cp = c0 & 0x07;
        min = 0x10000;
    } else {
        return kInvalidCodePoint;
    }
    if (str.size() < n) {
        return kInvalidCodePoint;
    }
    for (std::size_t i = 1; i < n; i++) {
        unsigned c = static_cast<unsigned char>(str[i]);
        if ((c & 0xc0) != 0x80) {
            return kInvalidCodePoint;
        }
        cp = (cp << 6) | (c & 0x3f);
    }
    if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        return kInvalidCodePoint;
    }
    *len = n;
    return cp;
}

bool IsValidUTF8(std::string_view str) {
    while (!str.empty()) {
        std::size_t len;
        if (DecodeUTF8(str, &len) == kInvalidCodePoint) {
            return false;
        }
        str.remove_prefix(len);
    }
    return true;
}

void AppendUTF8(std::string *out, char32_t c) {
    if (c < 0x80) {
        out->push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out->push_back(static_cast<char>(0xc0 | (c >> 6)));
        out->push_back(static_cast<char>(0x80 | (c & 0x3f)));
    } else if (c < 0x10000) {
        out->push_back(static_cast<char>(0xe0 | (c >> 12)));
        out->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | (c & 0x3f)));
    } else {
        out->push_back(static_cast<char>(0xf0 | (c >> 18)));
        out->push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        out->push_back(static_cast<char>(0x80 | (c & 0x3f)));
    }
}

} // namespace util
