// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#pragma once

#include "lib/linequote/quote.hpp"
#include "lib/linequote/style.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace linequote {

// Quote a line with the named style. A line quoted with an unknown style name
// is returned unchanged; callers should check names with LookupStyle first.
std::string Quote(std::string_view line, std::string_view style_name);

// Quotes lines with a fixed style and options.
class LineQuoter {
public:
    explicit LineQuoter(Style style) : m_style{style} {}
    LineQuoter(Style style, CSVOptions csv)
        : m_style{style}, m_csv{std::move(csv)} {}

    Style style() const { return m_style; }
    const CSVOptions &csv() const { return m_csv; }

    std::string Quote(std::string_view line) const;

private:
    Style m_style;
    CSVOptions m_csv;
};

// A sequence of lines, with delimiters already removed.
class LineSource {
public:
    virtual ~LineSource();

    // Get the next line. Returns false if there are no more lines.
    virtual bool Next(std::string *line) = 0;
};

// Line source which reads from a list of lines in memory.
class VectorLineSource : public LineSource {
public:
    explicit VectorLineSource(const std::vector<std::string> *lines)
        : m_lines{lines}, m_pos{0} {}

    bool Next(std::string *line) override;

    // Start over from the first line.
    void Rewind() { m_pos = 0; }

private:
    const std::vector<std::string> *m_lines;
    std::size_t m_pos;
};

// Lazily quotes the lines of a source, in order. Each call to Next reads
// exactly one line from the source.
class QuotedLines {
public:
    QuotedLines(const LineQuoter &quoter, LineSource *source)
        : m_quoter{quoter}, m_source{source} {}

    // Get the next quoted line. Returns false if there are no more lines.
    bool Next(std::string *line);

private:
    const LineQuoter &m_quoter;
    LineSource *m_source;
    std::string m_raw;
};

} // namespace linequote
