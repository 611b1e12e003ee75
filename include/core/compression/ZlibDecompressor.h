/*
 * ZlibDecompressor.h - zlib (RFC 1950) decompressor
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H
#define ID3PEEK_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H

#include "core/compression/Decompressor.h"

namespace ID3Peek {
namespace Core {
namespace Compression {

/**
 * @brief zlib stream decompressor used for compressed ID3v2 frames
 */
class ZlibDecompressor : public Decompressor {
public:
    /**
     * @param max_output Upper bound on the decompressed size; larger
     *        output is treated as a corrupt stream
     */
    explicit ZlibDecompressor(size_t max_output);

    std::vector<uint8_t> decompress(const uint8_t* data, size_t size,
                                    size_t expected_size = 0) override;

private:
    std::vector<uint8_t> inflateStream(const uint8_t* data, size_t size);

    size_t m_max_output;
};

} // namespace Compression
} // namespace Core
} // namespace ID3Peek

#endif // ID3PEEK_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H
