// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace util {

// Wrapper for std::FILE. Standard streams are borrowed, not closed.
class File {
public:
    File() : m_file{nullptr}, m_owned{false} {}
    File(const File &) = delete;
    File(File &&other)
        : m_file{other.m_file},
          m_owned{other.m_owned},
          m_name{std::move(other.m_name)} {
        other.m_file = nullptr;
    }
    ~File() {
        if (m_file != nullptr && m_owned) {
            std::fclose(m_file);
        }
    }
    File &operator=(const File &) = delete;
    File &operator=(File &&other) {
        using std::swap;
        swap(m_file, other.m_file);
        swap(m_owned, other.m_owned);
        swap(m_name, other.m_name);
        return *this;
    }
    operator bool() const { return m_file != nullptr; }
    bool operator!() const { return m_file == nullptr; }

    // Set the file handle and its name. If owned, the handle is closed when
    // replaced or when this object is destroyed.
    void Set(std::FILE *file, std::string_view name, bool owned);

    // Close the file. Raises an error if data is not flushed. Borrowed
    // handles are released without being closed.
    void Close();

    // Return the name of the file, used to open it.
    std::string_view name() const { return m_name; }

    // Get the file handle.
    std::FILE *file() { return m_file; }

private:
    std::FILE *m_file;
    bool m_owned;
    std::string m_name;
};

// A wrapper for input files.
class InputFile : private File {
public:
    // Open a file for reading. The name "-" opens standard input.
    void Open(const std::string &name);

    // Read the next record terminated by the delimiter into *record, without
    // the delimiter. A final record with no delimiter is returned as-is.
    // Returns false at end of file. Throws an error on failure.
    bool ReadRecord(char delimiter, std::string *record);

    // Read the next newline-terminated line. A CR before the newline is
    // removed.
    bool ReadLine(std::string *line);

    using File::Close;
    using File::name;
};

// A wrapper for output files.
class OutputFile : private File {
public:
    // Create a file for writing. The name "-" writes to standard output.
    void Create(const std::string &name);

    // Commit all data to disk.
    void Commit();

    using File::name;

    void Write(const void *ptr, size_t size);
    void Write(std::string_view data) { Write(data.data(), data.size()); }
    void Put(char c) { Write(&c, 1); }
};

} // namespace util
