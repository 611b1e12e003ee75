/*
 * Decompressor.h - Decompressor interface
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_CORE_COMPRESSION_DECOMPRESSOR_H
#define ID3PEEK_CORE_COMPRESSION_DECOMPRESSOR_H

#include <vector>
#include <cstdint>
#include <cstddef>

namespace ID3Peek {
namespace Core {
namespace Compression {

/**
 * @brief Interface for decompression algorithms
 */
class Decompressor {
public:
    virtual ~Decompressor() = default;

    /**
     * @brief Decompress data
     * 
     * @param data Compressed data pointer
     * @param size Compressed data size in bytes
     * @param expected_size Decompressed size announced by the container,
     *        or 0 when unknown
     * @return Decompressed data
     * @throws TagException (MalformedFrame) if the stream is corrupt
     */
    virtual std::vector<uint8_t> decompress(const uint8_t* data, size_t size,
                                            size_t expected_size = 0) = 0;
};

} // namespace Compression
} // namespace Core
} // namespace ID3Peek

#endif // ID3PEEK_CORE_COMPRESSION_DECOMPRESSOR_H
