/*
 * Metadata.cpp - Aggregated view of the tags found in a file
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Tag {

std::optional<std::string> Metadata::getField(CommonField field) const {
    auto it = m_fields.find(field);
    if (it == m_fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Metadata::formatName() const {
    if (hasID3v2() && hasID3v1()) {
        return m_id3v2_format + " + " + m_id3v1_format;
    }
    return hasID3v2() ? m_id3v2_format : m_id3v1_format;
}

const Picture* Metadata::picture(size_t index) const {
    if (index >= m_pictures.size()) {
        return nullptr;
    }
    return &m_pictures[index];
}

std::vector<std::string> Metadata::frameIds() const {
    std::vector<std::string> ids;
    for (const DecodedFrame& frame : m_frames) {
        const std::string& id = frameId(frame);
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace Tag
} // namespace ID3Peek
