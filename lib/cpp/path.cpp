// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/path.hpp"

namespace util {

std::string_view Basename(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    size_t i = path.rfind('/');
    if (i == std::string_view::npos || path.size() == 1) {
        return path;
    }
    return path.substr(i + 1);
}

bool IsStdio(std::string_view path) {
    return path == "-";
}

} // namespace util
