// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/cpp/file.hpp"

#include "lib/cpp/error.hpp"
#include "lib/cpp/path.hpp"

#include <errno.h>

namespace util {

namespace {

const char kStdinName[] = "<stdin>";
const char kStdoutName[] = "<stdout>";

} // namespace

void File::Set(std::FILE *file, std::string_view name, bool owned) {
    m_name = name;
    if (m_file != nullptr && m_owned) {
        std::fclose(m_file);
    }
    m_file = file;
    m_owned = owned;
}

void File::Close() {
    int r = m_owned ? std::fclose(m_file) : 0;
    m_file = nullptr;
    m_owned = false;
    std::string name;
    std::swap(name, m_name);
    if (r != 0) {
        throw IOError(name, "close", errno);
    }
}

void InputFile::Open(const std::string &name) {
    if (IsStdio(name)) {
        Set(stdin, kStdinName, false);
        return;
    }
    FILE *fp = std::fopen(name.c_str(), "rb");
    if (fp == nullptr) {
        throw IOError(name, "open", errno);
    }
    Set(fp, name, true);
}

bool InputFile::ReadRecord(char delimiter, std::string *record) {
    record->clear();
    std::FILE *fp = file();
    for (;;) {
        int c = std::getc(fp);
        if (c == EOF) {
            if (std::ferror(fp)) {
                throw IOError(name(), "read", errno);
            }
            return !record->empty();
        }
        if (c == static_cast<unsigned char>(delimiter)) {
            return true;
        }
        record->push_back(static_cast<char>(c));
    }
}

bool InputFile::ReadLine(std::string *line) {
    if (!ReadRecord('\n', line)) {
        return false;
    }
    if (!line->empty() && line->back() == '\r') {
        line->pop_back();
    }
    return true;
}

void OutputFile::Create(const std::string &name) {
    if (IsStdio(name)) {
        Set(stdout, kStdoutName, false);
        return;
    }
    FILE *fp = std::fopen(name.c_str(), "wb");
    if (fp == nullptr) {
        throw IOError(name, "create", errno);
    }
    Set(fp, name, true);
}

void OutputFile::Commit() {
    if (std::fflush(file()) != 0) {
        throw IOError(name(), "write", errno);
    }
    File::Close();
}

void OutputFile::Write(const void *ptr, size_t size) {
    size_t r = std::fwrite(ptr, 1, size, file());
    if (r != size) {
        throw IOError(name(), "write", errno);
    }
}

} // namespace util
