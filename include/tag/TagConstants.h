/*
 * TagConstants.h - Limits and fixed sizes for tag parsing
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_TAGCONSTANTS_H
#define ID3PEEK_TAG_TAGCONSTANTS_H

#include <cstdint>
#include <cstddef>

namespace ID3Peek {
namespace Tag {

namespace TagConstants {

// Fixed structure sizes
constexpr size_t ID3V1_SIZE = 128;
constexpr size_t ID3V2_HEADER_SIZE = 10;
constexpr size_t ID3V2_FOOTER_SIZE = 10;

// Global limits to prevent excessive memory usage / DoS
constexpr size_t MAX_FRAME_SIZE = 100 * 1024 * 1024;       // 100 MB
constexpr size_t MAX_DECOMPRESSED_SIZE = 100 * 1024 * 1024; // 100 MB
constexpr size_t MAX_FRAME_COUNT = 100000;                 // 100k frames
constexpr size_t MAX_MIME_TYPE_LENGTH = 256;               // 256 bytes

} // namespace TagConstants

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_TAGCONSTANTS_H
