/*
 * ID3v2Frame.cpp - ID3v2 frame and decoded frame types
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Tag {

FrameKind frameKindFor(const std::string& id) {
    if (id == "TXXX") {
        return FrameKind::UserText;
    }
    if (id.size() == 4 && id[0] == 'T') {
        return FrameKind::Text;
    }
    if (id == "COMM") {
        return FrameKind::Comment;
    }
    if (id == "USLT") {
        return FrameKind::Lyrics;
    }
    if (id == "APIC") {
        return FrameKind::Picture;
    }
    return FrameKind::Unknown;
}

const std::string& frameId(const DecodedFrame& frame) {
    return std::visit([](const auto& f) -> const std::string& { return f.id; }, frame);
}

} // namespace Tag
} // namespace ID3Peek
