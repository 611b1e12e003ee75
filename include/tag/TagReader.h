/*
 * TagReader.h - Entry point: read every ID3 tag from a byte source
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_TAGREADER_H
#define ID3PEEK_TAG_TAGREADER_H

#include "tag/Metadata.h"

namespace ID3Peek {
namespace IO {
class IOHandler;
}

namespace Tag {

/**
 * @brief Reads the ID3v2 tag at the start and the ID3v1 tag at the end
 * 
 * Only the tag regions are read: the container's header and declared
 * size, and the last 128 bytes. The source is borrowed for the call.
 */
class TagReader {
public:
    /**
     * @brief Read tags from a seekable source
     * @throws TagException (InputTooShort, NoTag, or the container error
     *         when there is no ID3v1 tag to fall back on)
     * @throws IOException if the source fails
     */
    static Metadata parse(IO::IOHandler& source);
    
    /**
     * @brief Read tags from a complete in-memory file
     */
    static Metadata parse(const uint8_t* data, size_t size);
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_TAGREADER_H
