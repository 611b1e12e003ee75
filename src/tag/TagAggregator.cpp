/*
 * TagAggregator.cpp - Merge ID3v1 and ID3v2 into one Metadata view
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Tag {

Metadata TagAggregator::aggregate(const ID3v1Tag* v1, const ID3v2Tag* v2) {
    Metadata metadata;
    
    for (CommonField field : allCommonFields()) {
        std::optional<std::string> value;
        if (v2) {
            value = v2->getField(field);
        }
        if ((!value || value->empty()) && v1) {
            value = v1->getField(field);
        }
        if (value && !value->empty()) {
            metadata.m_fields[field] = *value;
        }
    }
    
    if (v2) {
        metadata.m_comments = v2->comments();
        metadata.m_lyrics = v2->lyrics();
        metadata.m_pictures = v2->pictures();
        metadata.m_frames = v2->decodedFrames();
        metadata.m_warnings = v2->warnings();
        metadata.m_id3v2_format = v2->formatName();
    }
    if (v1) {
        metadata.m_id3v1_format = v1->formatName();
    }
    
    Debug::log("tag", "TagAggregator::aggregate: ", metadata.formatName(), ", ",
               metadata.m_fields.size(), " fields, ", metadata.m_pictures.size(), " pictures, ",
               metadata.m_warnings.size(), " warnings");
    
    return metadata;
}

} // namespace Tag
} // namespace ID3Peek
