/*
 * ID3v2Frame.h - ID3v2 frame and decoded frame types
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V2FRAME_H
#define ID3PEEK_TAG_ID3V2FRAME_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "exceptions.h"
#include "tag/Tag.h"
#include "tag/ID3v2Utils.h"

namespace ID3Peek {
namespace Tag {

/**
 * @brief One frame as stored in an ID3v2 tag
 *
 * The payload has had frame-level unsynchronisation, the flag data
 * (group id, encryption method, data length) and compression removed, so
 * it is ready for the frame decoders. If that unwrapping failed, the frame
 * is marked opaque and its payload is the bytes as found.
 */
struct ID3v2Frame {
    std::string id;              // v2.3/v2.4 spelling, e.g. "TIT2"
    std::string original_id;     // As stored; differs from id for v2.2
    uint32_t declared_size = 0;  // Size field from the frame header
    uint16_t flags = 0;          // Raw flag bytes, 0 for v2.2
    size_t offset = 0;           // Offset of the frame header within the tag
    bool compressed = false;
    bool encrypted = false;
    std::optional<uint8_t> group_id;
    std::vector<uint8_t> data;   // Payload
    
    bool opaque = false;         // Payload could not be unwrapped
    std::string opaque_reason;
};

/**
 * @brief Semantic kind of a frame, chosen by its identifier
 */
enum class FrameKind {
    Text,       // T*** except TXXX
    UserText,   // TXXX
    Comment,    // COMM
    Lyrics,     // USLT
    Picture,    // APIC
    Unknown
};

/**
 * @brief Look up the kind of a normalised (four character) frame id
 */
FrameKind frameKindFor(const std::string& id);

// ============================================================================
// Decoded frames
// ============================================================================

/**
 * @brief Text information frame
 *
 * values holds every null-separated string; the first is the one exposed
 * as a common field.
 */
struct TextFrame {
    std::string id;
    ID3v2Utils::TextEncoding encoding = ID3v2Utils::TextEncoding::ISO_8859_1;
    std::string description;     // TXXX only
    std::vector<std::string> values;
    
    std::string first() const { return values.empty() ? std::string() : values.front(); }
};

/**
 * @brief COMM and USLT frames, which share one layout
 */
struct CommentFrame {
    std::string id;
    FrameKind kind = FrameKind::Comment;
    ID3v2Utils::TextEncoding encoding = ID3v2Utils::TextEncoding::ISO_8859_1;
    std::string language;
    std::string description;
    std::string text;
    
    CommentEntry toEntry() const { return CommentEntry{language, description, text}; }
};

struct PictureFrame {
    std::string id;
    ID3v2Utils::TextEncoding encoding = ID3v2Utils::TextEncoding::ISO_8859_1;
    Picture picture;
};

/**
 * @brief A frame kept as bytes: unknown identifiers and frames that failed to decode
 */
struct RawFrame {
    std::string id;
    std::vector<uint8_t> data;
    std::optional<ParseError> error;  // Set when decoding failed
    std::string reason;
};

using DecodedFrame = std::variant<TextFrame, CommentFrame, PictureFrame, RawFrame>;

/**
 * @brief Identifier of any decoded frame
 */
const std::string& frameId(const DecodedFrame& frame);

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V2FRAME_H
