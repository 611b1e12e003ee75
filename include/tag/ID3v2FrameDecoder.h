/*
 * ID3v2FrameDecoder.h - ID3v2 frame payload decoders
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V2FRAMEDECODER_H
#define ID3PEEK_TAG_ID3V2FRAMEDECODER_H

#include "tag/ID3v2Frame.h"

namespace ID3Peek {
namespace Tag {

/**
 * @brief Turns frame payloads into typed frames
 *
 * decode() never throws: a payload that cannot be decoded comes back as a
 * RawFrame whose error and reason say why. The per-kind decoders throw
 * TagException and are public for tests.
 */
class ID3v2FrameDecoder {
public:
    /**
     * @brief Decode a frame according to frameKindFor(frame.id)
     * @param major_version Tag revision; selects the v2.2 picture layout
     */
    static DecodedFrame decode(const ID3v2Frame& frame, uint8_t major_version);
    
    /**
     * @brief T*** frames: encoding byte, then null-separated values
     * @throws TagException (UnsupportedEncoding, MalformedFrame)
     */
    static TextFrame decodeText(const ID3v2Frame& frame);
    
    /**
     * @brief TXXX: encoding byte, description, then value(s)
     */
    static TextFrame decodeUserText(const ID3v2Frame& frame);
    
    /**
     * @brief COMM and USLT: encoding, language[3], description, text
     */
    static CommentFrame decodeComment(const ID3v2Frame& frame, FrameKind kind);
    
    /**
     * @brief APIC (v2.3/2.4) and PIC (v2.2)
     *
     * APIC: encoding, MIME type (Latin-1, terminated), picture type,
     * description, image bytes. PIC carries a 3-character image format
     * ("JPG", "PNG") instead of the MIME type.
     */
    static PictureFrame decodePicture(const ID3v2Frame& frame, uint8_t major_version);
    
    /**
     * @brief Map a v2.2 image format code to a MIME type
     * @return e.g. "image/jpeg" for "JPG"; unknown codes become "image/<code>"
     */
    static std::string mimeTypeFromFormat(const std::string& format);
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V2FRAMEDECODER_H
