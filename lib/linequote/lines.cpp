// Copyright 2022 Dietrich Epp.
// This file is part of Linequote. Linequote is licensed under the terms of the
// Mozilla Public License, version 2.0. See LICENSE.txt for details.
#include "lib/linequote/lines.hpp"

#include <optional>

namespace linequote {

std::string Quote(std::string_view line, std::string_view style_name) {
    std::optional<Style> style = LookupStyle(style_name);
    if (!style.has_value()) {
        return std::string(line);
    }
    return Quote(line, *style);
}

std::string LineQuoter::Quote(std::string_view line) const {
    return linequote::Quote(line, m_style, m_csv);
}

LineSource::~LineSource() {}

bool VectorLineSource::Next(std::string *line) {
    if (m_pos >= m_lines->size()) {
        return false;
    }
    *line = (*m_lines)[m_pos];
    m_pos++;
    return true;
}

bool QuotedLines::Next(std::string *line) {
    if (!m_source->Next(&m_raw)) {
        return false;
    }
    *line = m_quoter.Quote(m_raw);
    return true;
}

} // namespace linequote
