/*
 * ImageUtils.h - Embedded image header inspection
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_IMAGEUTILS_H
#define ID3PEEK_TAG_IMAGEUTILS_H

#include <cstdint>
#include <cstddef>
#include <string>
#include "tag/Tag.h"

namespace ID3Peek {
namespace Tag {
namespace ImageUtils {

/**
 * @brief Identify an image by its signature bytes
 * @return "image/jpeg", "image/png", "image/gif", "image/bmp", or an
 *         empty string if the format is not recognised
 */
std::string sniffMimeType(const uint8_t* data, size_t size);

/**
 * @brief Extract dimensions from raw image data
 * 
 * Inspects the image header (JPEG, PNG, GIF, BMP) to determine
 * width, height, and color depth. The format is taken from the data
 * itself since MIME types in tags are frequently wrong.
 * 
 * @param picture Picture structure to update (reads data, writes width/height/depth)
 */
void extractDimensions(Picture& picture);

} // namespace ImageUtils
} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_IMAGEUTILS_H
