/*
 * ID3v2FrameDecoder.cpp - ID3v2 frame payload decoders
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <cctype>

using ID3Peek::Core::Utility::UTF8Util;

namespace ID3Peek {
namespace Tag {

using ID3v2Utils::TextEncoding;

// Read and validate the leading encoding byte
static TextEncoding readEncoding(const ID3v2Frame& frame) {
    if (frame.data.empty()) {
        throw TagException(ParseError::MalformedFrame, frame.id + ": empty payload");
    }
    return ID3v2Utils::encodingFromByte(frame.data[0]);
}

DecodedFrame ID3v2FrameDecoder::decode(const ID3v2Frame& frame, uint8_t major_version) {
    FrameKind kind = frameKindFor(frame.id);
    if (major_version < 4 && kind != FrameKind::Unknown && !frame.data.empty() &&
        (frame.data[0] == 2 || frame.data[0] == 3)) {
        // UTF-16BE and UTF-8 only exist from v2.4 on; decode them anyway
        Debug::log("frame", "ID3v2FrameDecoder::decode: ", frame.id, " uses ",
                   ID3v2Utils::encodingName(static_cast<TextEncoding>(frame.data[0])),
                   " in a v2.", static_cast<int>(major_version), " tag");
    }
    try {
        switch (kind) {
            case FrameKind::Text:
                return decodeText(frame);
            case FrameKind::UserText:
                return decodeUserText(frame);
            case FrameKind::Comment:
            case FrameKind::Lyrics:
                return decodeComment(frame, kind);
            case FrameKind::Picture:
                return decodePicture(frame, major_version);
            case FrameKind::Unknown:
                break;
        }
    } catch (const TagException& e) {
        Debug::log("frame", "ID3v2FrameDecoder::decode: ", frame.id, " kept raw: ", e.what());
        return RawFrame{frame.id, frame.data, e.code(), e.what()};
    }
    
    return RawFrame{frame.id, frame.data, std::nullopt, ""};
}

TextFrame ID3v2FrameDecoder::decodeText(const ID3v2Frame& frame) {
    TextFrame text;
    text.id = frame.id;
    text.encoding = readEncoding(frame);
    text.values = ID3v2Utils::decodeTextValues(frame.data.data() + 1, frame.data.size() - 1,
                                               text.encoding);
    
    Debug::log("frame", "ID3v2FrameDecoder::decodeText: ", frame.id, " = '", text.first(),
               "' (", text.values.size(), " value(s))");
    return text;
}

TextFrame ID3v2FrameDecoder::decodeUserText(const ID3v2Frame& frame) {
    TextFrame text;
    text.id = frame.id;
    text.encoding = readEncoding(frame);
    
    const uint8_t* data = frame.data.data() + 1;
    size_t size = frame.data.size() - 1;
    size_t consumed = 0;
    text.description = ID3v2Utils::readTerminatedString(data, size, text.encoding, consumed);
    text.values = ID3v2Utils::decodeTextValues(data + consumed, size - consumed, text.encoding);
    
    Debug::log("frame", "ID3v2FrameDecoder::decodeUserText: ", text.description, " = '",
               text.first(), "'");
    return text;
}

CommentFrame ID3v2FrameDecoder::decodeComment(const ID3v2Frame& frame, FrameKind kind) {
    CommentFrame comment;
    comment.id = frame.id;
    comment.kind = kind;
    comment.encoding = readEncoding(frame);
    
    if (frame.data.size() < 4) {
        throw TagException(ParseError::MalformedFrame,
                           frame.id + ": payload too short for language code");
    }
    
    const uint8_t* data = frame.data.data();
    size_t size = frame.data.size();
    comment.language = UTF8Util::fromLatin1(data + 1, 3);
    
    size_t offset = 4;
    size_t consumed = 0;
    comment.description = ID3v2Utils::readTerminatedString(data + offset, size - offset,
                                                           comment.encoding, consumed);
    offset += consumed;
    comment.text = ID3v2Utils::decodeText(data + offset, size - offset, comment.encoding);
    
    Debug::log("frame", "ID3v2FrameDecoder::decodeComment: ", frame.id, " lang=", comment.language,
               ", desc='", comment.description, "', ", comment.text.size(), " bytes of text");
    return comment;
}

PictureFrame ID3v2FrameDecoder::decodePicture(const ID3v2Frame& frame, uint8_t major_version) {
    PictureFrame result;
    result.id = frame.id;
    result.encoding = readEncoding(frame);
    
    const uint8_t* data = frame.data.data();
    size_t size = frame.data.size();
    size_t offset = 1;
    Picture& picture = result.picture;
    
    if (major_version == 2) {
        // Image format (3 bytes: "JPG", "PNG", etc.)
        if (offset + 3 > size) {
            throw TagException(ParseError::MalformedFrame, frame.id + ": no image format");
        }
        std::string format = UTF8Util::fromLatin1(data + offset, 3);
        picture.mime_type = mimeTypeFromFormat(format);
        offset += 3;
    } else {
        // MIME type is always Latin-1 with a single-byte terminator
        size_t mime_len = UTF8Util::findNullTerminator(data + offset, size - offset, 1);
        if (offset + mime_len >= size) {
            throw TagException(ParseError::MalformedFrame, frame.id + ": MIME type not terminated");
        }
        if (mime_len > TagConstants::MAX_MIME_TYPE_LENGTH) {
            throw TagException(ParseError::MalformedFrame,
                               frame.id + ": MIME type too long (" + std::to_string(mime_len) + " bytes)");
        }
        picture.mime_type = UTF8Util::fromLatin1(data + offset, mime_len);
        if (!picture.mime_type.empty() && picture.mime_type.find('/') == std::string::npos &&
            picture.mime_type != "-->") {
            // Bare format code written where a MIME type belongs
            picture.mime_type = mimeTypeFromFormat(picture.mime_type);
        }
        offset += mime_len + 1;
    }
    
    if (offset >= size) {
        throw TagException(ParseError::MalformedFrame, frame.id + ": no picture type");
    }
    picture.type = static_cast<PictureType>(data[offset]);
    offset++;
    
    size_t consumed = 0;
    picture.description = ID3v2Utils::readTerminatedString(data + offset, size - offset,
                                                           result.encoding, consumed);
    offset += consumed;
    
    if (offset >= size) {
        throw TagException(ParseError::MalformedFrame, frame.id + ": no picture data");
    }
    
    // The image bytes are passed through untouched
    picture.data.assign(data + offset, data + size);
    
    if (picture.mime_type.empty()) {
        picture.mime_type = ImageUtils::sniffMimeType(picture.data.data(), picture.data.size());
    }
    if (picture.mime_type != "-->") {
        ImageUtils::extractDimensions(picture);
    }
    
    Debug::log("frame", "ID3v2FrameDecoder::decodePicture: ", frame.id, " type=",
               static_cast<int>(picture.type), " (", pictureTypeName(picture.type), "), MIME=",
               picture.mime_type, ", desc='", picture.description, "', size=", picture.data.size());
    return result;
}

std::string ID3v2FrameDecoder::mimeTypeFromFormat(const std::string& format) {
    std::string upper;
    for (char c : format) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    
    if (upper == "JPG" || upper == "JPEG") {
        return "image/jpeg";
    } else if (upper == "PNG") {
        return "image/png";
    } else if (upper == "GIF") {
        return "image/gif";
    } else if (upper == "BMP") {
        return "image/bmp";
    }
    
    std::string lower;
    for (char c : format) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return "image/" + lower;
}

} // namespace Tag
} // namespace ID3Peek
