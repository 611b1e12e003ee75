/*
 * ID3v2FrameLayout.cpp - Per-revision ID3v2 frame header layouts
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Tag {

const ID3v2FrameLayout& ID3v2FrameLayout::forVersion(uint8_t major_version) {
    static const ID3v2FrameLayout v22(2, 3, 3, false);
    static const ID3v2FrameLayout v23(3, 4, 4, false);
    static const ID3v2FrameLayout v24(4, 4, 4, true);
    
    switch (major_version) {
        case 2: return v22;
        case 3: return v23;
        case 4: return v24;
        default:
            throw TagException(ParseError::UnsupportedRevision,
                               "unsupported ID3v2 revision 2." + std::to_string(major_version));
    }
}

bool ID3v2FrameLayout::hasValidId(const uint8_t* header) const {
    for (size_t i = 0; i < m_id_length; ++i) {
        uint8_t c = header[i];
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            return false;
        }
    }
    return true;
}

std::string ID3v2FrameLayout::readId(const uint8_t* header) const {
    return std::string(reinterpret_cast<const char*>(header), m_id_length);
}

uint32_t ID3v2FrameLayout::readSize(const uint8_t* header) const {
    if (m_synchsafe_sizes) {
        return ID3v2Utils::decodeSynchsafeBytes(header + m_id_length);
    }
    return readPlainSize(header);
}

uint32_t ID3v2FrameLayout::readPlainSize(const uint8_t* header) const {
    return ID3v2Utils::readBigEndian(header + m_id_length, m_size_length);
}

uint16_t ID3v2FrameLayout::readFlags(const uint8_t* header) const {
    if (!hasFlags()) {
        return 0;
    }
    const uint8_t* flags = header + m_id_length + m_size_length;
    return static_cast<uint16_t>((flags[0] << 8) | flags[1]);
}

ID3v2FrameFlags ID3v2FrameLayout::decodeFlags(uint16_t flags) const {
    ID3v2FrameFlags result;
    if (m_version == 3) {
        result.tag_alter_preservation  = (flags & 0x8000) != 0;
        result.file_alter_preservation = (flags & 0x4000) != 0;
        result.read_only               = (flags & 0x2000) != 0;
        result.compression             = (flags & 0x0080) != 0;
        result.encryption              = (flags & 0x0040) != 0;
        result.grouping                = (flags & 0x0020) != 0;
    } else if (m_version == 4) {
        result.tag_alter_preservation  = (flags & 0x4000) != 0;
        result.file_alter_preservation = (flags & 0x2000) != 0;
        result.read_only               = (flags & 0x1000) != 0;
        result.grouping                = (flags & 0x0040) != 0;
        result.compression             = (flags & 0x0008) != 0;
        result.encryption              = (flags & 0x0004) != 0;
        result.unsynchronisation       = (flags & 0x0002) != 0;
        result.data_length_indicator   = (flags & 0x0001) != 0;
    }
    return result;
}

} // namespace Tag
} // namespace ID3Peek
