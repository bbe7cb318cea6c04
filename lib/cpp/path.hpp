// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <string_view>

namespace util {

// Return the basename of a path. Trailing slashes are ignored.
std::string_view Basename(std::string_view path);

// Return true if the path names standard input or output.
bool IsStdio(std::string_view path);

} // namespace util
