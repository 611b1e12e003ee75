/*
 * ID3v2Utils.cpp - ID3v2 utility functions
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <stdexcept>

using ID3Peek::Core::Utility::UTF8Util;

namespace ID3Peek {
namespace Tag {
namespace ID3v2Utils {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

bool canEncodeSynchsafe(uint32_t value) {
    // Synchsafe integers can only encode 28 bits
    return value <= 0x0FFFFFFF;
}

uint32_t encodeSynchsafe(uint32_t value) {
    if (!canEncodeSynchsafe(value)) {
        throw std::out_of_range("value " + std::to_string(value) + " exceeds 28 bits");
    }
    uint32_t result = 0;
    result |= (value & 0x0000007F);        // Bits 0-6
    result |= (value & 0x00003F80) << 1;   // Bits 7-13 -> 8-14
    result |= (value & 0x001FC000) << 2;   // Bits 14-20 -> 16-22
    result |= (value & 0x0FE00000) << 3;   // Bits 21-27 -> 24-30
    return result;
}

uint32_t decodeSynchsafe(uint32_t synchsafe) {
    if (synchsafe & 0x80808080) {
        throw TagException(ParseError::InvalidSynchsafe,
                           "synchsafe integer has a high bit set");
    }
    uint32_t result = 0;
    result |= (synchsafe & 0x0000007F);        // Bits 0-6
    result |= (synchsafe & 0x00007F00) >> 1;   // Bits 8-14 -> 7-13
    result |= (synchsafe & 0x007F0000) >> 2;   // Bits 16-22 -> 14-20
    result |= (synchsafe & 0x7F000000) >> 3;   // Bits 24-30 -> 21-27
    return result;
}

uint32_t decodeSynchsafeBytes(const uint8_t* data) {
    return static_cast<uint32_t>(decodeSynchsafeWide(data, 4));
}

uint64_t decodeSynchsafeWide(const uint8_t* data, size_t count) {
    if (!data || count == 0 || count > 9) {
        throw std::invalid_argument("synchsafe width must be 1 to 9 bytes");
    }
    uint64_t result = 0;
    for (size_t i = 0; i < count; ++i) {
        if (data[i] & 0x80) {
            throw TagException(ParseError::InvalidSynchsafe,
                               "synchsafe byte " + std::to_string(i) + " has its high bit set");
        }
        result = (result << 7) | data[i];
    }
    return result;
}

void encodeSynchsafeBytes(uint32_t value, uint8_t* out) {
    if (!canEncodeSynchsafe(value)) {
        throw std::out_of_range("value " + std::to_string(value) + " exceeds 28 bits");
    }
    // Big-endian byte order, 7 bits per byte
    out[0] = static_cast<uint8_t>((value >> 21) & 0x7F);
    out[1] = static_cast<uint8_t>((value >> 14) & 0x7F);
    out[2] = static_cast<uint8_t>((value >> 7) & 0x7F);
    out[3] = static_cast<uint8_t>(value & 0x7F);
}

bool isSynchsafe(const uint8_t* data, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (data[i] & 0x80) {
            return false;
        }
    }
    return true;
}

uint32_t readBigEndian(const uint8_t* data, size_t count) {
    uint32_t result = 0;
    for (size_t i = 0; i < count && i < 4; ++i) {
        result = (result << 8) | data[i];
    }
    return result;
}

// ============================================================================
// Unsynchronization Functions
// ============================================================================

std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size) {
    std::vector<uint8_t> result;
    if (!data || size == 0) {
        return result;
    }
    
    result.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        result.push_back(data[i]);
        if (data[i] == 0xFF && i + 1 < size && data[i + 1] == 0x00) {
            ++i; // Drop the inserted zero
        }
    }
    
    return result;
}

// ============================================================================
// Text Encoding Functions
// ============================================================================

TextEncoding encodingFromByte(uint8_t value) {
    if (value > static_cast<uint8_t>(TextEncoding::UTF_8)) {
        throw TagException(ParseError::UnsupportedEncoding,
                           "unsupported text encoding " + std::to_string(value));
    }
    return static_cast<TextEncoding>(value);
}

const char* encodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::ISO_8859_1: return "ISO-8859-1";
        case TextEncoding::UTF_16_BOM: return "UTF-16";
        case TextEncoding::UTF_16_BE:  return "UTF-16BE";
        case TextEncoding::UTF_8:      return "UTF-8";
    }
    return "unknown";
}

size_t getNullTerminatorSize(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF_16_BOM:
        case TextEncoding::UTF_16_BE:
            return 2;
        case TextEncoding::ISO_8859_1:
        case TextEncoding::UTF_8:
        default:
            return 1;
    }
}

size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding) {
    return UTF8Util::findNullTerminator(data, size, getNullTerminatorSize(encoding));
}

/**
 * @brief Decode one value that holds no terminator
 *
 * @param big_endian In/out byte order for UTF-16 with BOM. A BOM at the
 *        start of the value updates it; later values without a BOM reuse it.
 */
static std::string decodeSegment(const uint8_t* data, size_t size,
                                 TextEncoding encoding, bool& big_endian) {
    switch (encoding) {
        case TextEncoding::ISO_8859_1:
            return UTF8Util::fromLatin1(data, size);
        case TextEncoding::UTF_16_BOM:
            if (size >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
                big_endian = false;
                data += 2;
                size -= 2;
            } else if (size >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
                big_endian = true;
                data += 2;
                size -= 2;
            }
            return big_endian ? UTF8Util::fromUTF16BE(data, size)
                              : UTF8Util::fromUTF16LE(data, size);
        case TextEncoding::UTF_16_BE:
            return UTF8Util::fromUTF16BE(data, size);
        case TextEncoding::UTF_8:
            return UTF8Util::decodeSafe(data, size);
    }
    return "";
}

/**
 * @brief Drop a lone zero byte left after the last whole UTF-16 unit
 *
 * Some writers pad UTF-16 text with a single 0x00. A dangling non-zero
 * byte is left alone so it still decodes to U+FFFD.
 */
static size_t trimUTF16Padding(const uint8_t* data, size_t size, TextEncoding encoding) {
    if (getNullTerminatorSize(encoding) == 2 && size % 2 != 0 && data[size - 1] == 0x00) {
        return size - 1;
    }
    return size;
}

std::vector<std::string> decodeTextValues(const uint8_t* data, size_t size, TextEncoding encoding) {
    std::vector<std::string> values;
    if (!data || size == 0) {
        return values;
    }
    
    size = trimUTF16Padding(data, size, encoding);
    size_t term_size = getNullTerminatorSize(encoding);
    bool big_endian = true;
    size_t pos = 0;
    
    while (pos < size) {
        size_t length = findNullTerminator(data + pos, size - pos, encoding);
        values.push_back(decodeSegment(data + pos, length, encoding, big_endian));
        if (length >= size - pos) {
            break; // Implicitly terminated by the end of the payload
        }
        pos += length + term_size;
    }
    
    while (!values.empty() && values.back().empty()) {
        values.pop_back();
    }
    
    return values;
}

std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding) {
    size_t consumed = 0;
    if (data) {
        size = trimUTF16Padding(data, size, encoding);
    }
    return readTerminatedString(data, size, encoding, consumed);
}

std::string readTerminatedString(const uint8_t* data, size_t size,
                                 TextEncoding encoding, size_t& consumed) {
    if (!data || size == 0) {
        consumed = 0;
        return "";
    }
    
    size_t length = findNullTerminator(data, size, encoding);
    bool big_endian = true;
    std::string text = decodeSegment(data, length, encoding, big_endian);
    consumed = std::min(size, length + getNullTerminatorSize(encoding));
    return text;
}

} // namespace ID3v2Utils
} // namespace Tag
} // namespace ID3Peek
