/*
 * ImageUtils.cpp - Embedded image header inspection
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include "tag/ImageUtils.h"

namespace ID3Peek {
namespace Tag {
namespace ImageUtils {

static uint32_t readBE16(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 8) | p[1];
}

static uint32_t readBE32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

static uint32_t readLE16(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8);
}

static uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::string sniffMimeType(const uint8_t* data, size_t size) {
    if (!data) {
        return "";
    }
    if (size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return "image/jpeg";
    }
    if (size >= 8 && std::memcmp(data, "\x89PNG\r\n\x1A\n", 8) == 0) {
        return "image/png";
    }
    if (size >= 6 && (std::memcmp(data, "GIF87a", 6) == 0 || std::memcmp(data, "GIF89a", 6) == 0)) {
        return "image/gif";
    }
    if (size >= 2 && data[0] == 'B' && data[1] == 'M') {
        return "image/bmp";
    }
    return "";
}

// Walk JPEG segments up to the first start-of-frame marker
static void extractJPEG(Picture& picture) {
    const uint8_t* data = picture.data.data();
    size_t size = picture.data.size();
    size_t pos = 2; // Past SOI

    while (pos + 4 <= size) {
        if (data[pos] != 0xFF) {
            return; // Lost sync
        }
        uint8_t marker = data[pos + 1];
        if (marker == 0xFF) {
            ++pos; // Fill byte
            continue;
        }
        if (marker == 0xD8 || (marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            pos += 2; // Standalone markers
            continue;
        }
        uint32_t length = readBE16(data + pos + 2);
        // SOF0-SOF15 except DHT (C4), JPG (C8) and DAC (CC)
        if (marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC) {
            if (pos + 9 < size) {
                picture.height = readBE16(data + pos + 5);
                picture.width = readBE16(data + pos + 7);
                picture.color_depth = data[pos + 4] * data[pos + 9]; // precision * components
            }
            return;
        }
        if (length < 2) {
            return;
        }
        pos += 2 + length;
    }
}

void extractDimensions(Picture& picture) {
    const uint8_t* data = picture.data.data();
    size_t size = picture.data.size();
    std::string format = sniffMimeType(data, size);

    if (format == "image/jpeg") {
        extractJPEG(picture);
    } else if (format == "image/png") {
        // IHDR is the first chunk: length(4) type(4) width(4) height(4) depth(1)
        if (size >= 25 && std::memcmp(data + 12, "IHDR", 4) == 0) {
            picture.width = readBE32(data + 16);
            picture.height = readBE32(data + 20);
            picture.color_depth = data[24];
        }
    } else if (format == "image/gif") {
        if (size >= 11) {
            picture.width = readLE16(data + 6);
            picture.height = readLE16(data + 8);
            uint8_t packed = data[10];
            if (packed & 0x80) { // Global color table flag
                picture.color_depth = (packed & 0x07) + 1;
            }
        }
    } else if (format == "image/bmp") {
        if (size >= 30) {
            picture.width = readLE32(data + 18);
            // Negative height marks a top-down bitmap
            int32_t height = static_cast<int32_t>(readLE32(data + 22));
            picture.height = static_cast<uint32_t>(height < 0 ? -static_cast<int64_t>(height) : height);
            picture.color_depth = readLE16(data + 28);
        }
    }
}

} // namespace ImageUtils
} // namespace Tag
} // namespace ID3Peek
