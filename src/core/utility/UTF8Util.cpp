/*
 * UTF8Util.cpp - UTF-8 conversion helpers for tag text
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Core {
namespace Utility {

static const std::string REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD

const std::string& UTF8Util::replacementCharacter() {
    return REPLACEMENT_CHAR;
}

bool UTF8Util::isValidCodepoint(uint32_t codepoint) {
    // U+0000 to U+10FFFF, excluding surrogates (U+D800-U+DFFF)
    return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (!isValidCodepoint(codepoint)) {
        output += REPLACEMENT_CHAR;
    } else if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string UTF8Util::encodeCodepoint(uint32_t codepoint) {
    std::string result;
    appendCodepoint(result, codepoint);
    return result;
}

uint32_t UTF8Util::decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed) {
    if (!data || size == 0) {
        bytesConsumed = 0;
        return 0xFFFD;
    }
    
    uint8_t c = data[0];
    
    if (c < 0x80) {
        bytesConsumed = 1;
        return c;
    }
    
    size_t length;
    uint32_t cp;
    uint32_t minimum;
    if ((c & 0xE0) == 0xC0) {
        length = 2;
        cp = c & 0x1F;
        minimum = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        length = 3;
        cp = c & 0x0F;
        minimum = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        length = 4;
        cp = c & 0x07;
        minimum = 0x10000;
    } else {
        // Stray continuation byte or invalid lead byte
        bytesConsumed = 1;
        return 0xFFFD;
    }
    
    if (size < length) {
        bytesConsumed = 1;
        return 0xFFFD;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (data[i] & 0x3F);
    }
    
    bytesConsumed = length;
    if (cp < minimum || !isValidCodepoint(cp)) {
        // Overlong form, surrogate or beyond U+10FFFF
        return 0xFFFD;
    }
    return cp;
}

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        if (cp == 0xFFFD && !(consumed == 3 && data[i] == 0xEF &&
                              data[i + 1] == 0xBF && data[i + 2] == 0xBD)) {
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::repair(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(bytes + i, text.size() - i, consumed);
        appendCodepoint(result, cp);
        i += consumed;
    }
    
    return result;
}

std::string UTF8Util::decodeSafe(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }
    
    size_t len = findNullTerminator(data, size, 1);
    std::string text(reinterpret_cast<const char*>(data), len);
    
    if (isValid(text)) {
        return text;
    }
    
    return repair(text);
}

// ============================================================================
// ISO-8859-1 (Latin-1) Conversion
// ============================================================================

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }
    
    std::string result;
    result.reserve(size * 2); // Worst case: every byte needs 2 bytes in UTF-8
    
    for (size_t i = 0; i < size && data[i] != 0x00; ++i) {
        appendCodepoint(result, data[i]);
    }
    
    return result;
}

// ============================================================================
// UTF-16 Conversion
// ============================================================================

std::string UTF8Util::fromUTF16(const uint8_t* data, size_t size, bool bigEndian) {
    if (!data || size == 0) {
        return "";
    }
    
    auto unitAt = [data, bigEndian](size_t offset) -> uint16_t {
        return bigEndian
            ? static_cast<uint16_t>((data[offset] << 8) | data[offset + 1])
            : static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
    };
    
    std::string result;
    result.reserve(size);
    
    size_t i = 0;
    for (; i + 1 < size; i += 2) {
        uint16_t unit = unitAt(i);
        
        if (unit == 0x0000) {
            return result; // Terminator
        }
        
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // High surrogate - need a low surrogate next
            if (i + 3 < size) {
                uint16_t low = unitAt(i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    uint32_t codepoint = 0x10000 +
                        ((static_cast<uint32_t>(unit - 0xD800) << 10) |
                         (low - 0xDC00));
                    appendCodepoint(result, codepoint);
                    i += 2;
                    continue;
                }
            }
            result += REPLACEMENT_CHAR;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            // Orphan low surrogate
            result += REPLACEMENT_CHAR;
        } else {
            appendCodepoint(result, unit);
        }
    }
    
    if (i < size) {
        // Half a code unit left over
        result += REPLACEMENT_CHAR;
    }
    
    return result;
}

std::string UTF8Util::fromUTF16LE(const uint8_t* data, size_t size) {
    return fromUTF16(data, size, false);
}

std::string UTF8Util::fromUTF16BE(const uint8_t* data, size_t size) {
    return fromUTF16(data, size, true);
}

std::string UTF8Util::fromUTF16BOM(const uint8_t* data, size_t size) {
    if (!data || size < 2) {
        return fromUTF16BE(data, size);
    }
    
    if (data[0] == 0xFF && data[1] == 0xFE) {
        return fromUTF16LE(data + 2, size - 2);
    } else if (data[0] == 0xFE && data[1] == 0xFF) {
        return fromUTF16BE(data + 2, size - 2);
    }
    // No BOM - assume big-endian
    return fromUTF16BE(data, size);
}

size_t UTF8Util::findNullTerminator(const uint8_t* data, size_t size, size_t bytesPerUnit) {
    if (!data || size == 0) {
        return 0;
    }
    
    if (bytesPerUnit == 2) {
        for (size_t i = 0; i + 1 < size; i += 2) {
            if (data[i] == 0x00 && data[i + 1] == 0x00) {
                return i;
            }
        }
        return size;
    }
    
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0x00) {
            return i;
        }
    }
    return size;
}

} // namespace Utility
} // namespace Core
} // namespace ID3Peek
