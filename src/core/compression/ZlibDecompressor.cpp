/*
 * ZlibDecompressor.cpp - zlib (RFC 1950) decompressor
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <zlib.h>

namespace ID3Peek {
namespace Core {
namespace Compression {

ZlibDecompressor::ZlibDecompressor(size_t max_output)
    : m_max_output(max_output) {
}

std::vector<uint8_t> ZlibDecompressor::decompress(const uint8_t* data, size_t size,
                                                  size_t expected_size) {
    if (!data || size == 0) {
        throw TagException(ParseError::MalformedFrame, "empty compressed stream");
    }

    if (expected_size == 0) {
        return inflateStream(data, size);
    }

    if (expected_size > m_max_output) {
        throw TagException(ParseError::MalformedFrame,
                           "decompressed size " + std::to_string(expected_size) +
                           " exceeds limit");
    }

    std::vector<uint8_t> output(expected_size);
    uLongf output_length = static_cast<uLongf>(expected_size);
    int zret = uncompress(output.data(), &output_length,
                          data, static_cast<uLong>(size));

    if (zret == Z_BUF_ERROR) {
        // Announced size was too small; fall back to growing the buffer
        Debug::log("frame", "ZlibDecompressor::decompress: announced size ", expected_size,
                   " too small, inflating incrementally");
        return inflateStream(data, size);
    }
    if (zret != Z_OK) {
        throw TagException(ParseError::MalformedFrame,
                           "uncompress failed, ret = " + std::to_string(zret));
    }

    output.resize(output_length);
    return output;
}

std::vector<uint8_t> ZlibDecompressor::inflateStream(const uint8_t* data, size_t size) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit(&stream) != Z_OK) {
        throw TagException(ParseError::MalformedFrame, "inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);

    std::vector<uint8_t> output;
    uint8_t chunk[16384];
    int zret = Z_OK;
    while (zret != Z_STREAM_END) {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);
        zret = inflate(&stream, Z_NO_FLUSH);
        if (zret != Z_OK && zret != Z_STREAM_END) {
            inflateEnd(&stream);
            throw TagException(ParseError::MalformedFrame,
                               "inflate failed, ret = " + std::to_string(zret));
        }
        size_t produced = sizeof(chunk) - stream.avail_out;
        if (output.size() + produced > m_max_output) {
            inflateEnd(&stream);
            throw TagException(ParseError::MalformedFrame, "decompressed data exceeds limit");
        }
        output.insert(output.end(), chunk, chunk + produced);
        if (zret == Z_OK && produced == 0 && stream.avail_in == 0) {
            // Input exhausted before the end of the stream
            inflateEnd(&stream);
            throw TagException(ParseError::MalformedFrame, "truncated compressed stream");
        }
    }

    inflateEnd(&stream);
    return output;
}

} // namespace Compression
} // namespace Core
} // namespace ID3Peek
