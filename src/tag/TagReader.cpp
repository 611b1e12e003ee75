/*
 * TagReader.cpp - Entry point: read every ID3 tag from a byte source
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {
namespace Tag {

Metadata TagReader::parse(const uint8_t* data, size_t size) {
    if (!data) {
        size = 0;
    }
    IO::MemoryIOHandler source(data, size, false);
    return parse(source);
}

Metadata TagReader::parse(IO::IOHandler& source) {
    off_t source_size = source.getFileSize();
    if (source_size < 0) {
        throw IOException("cannot determine the size of the source");
    }
    size_t size = static_cast<size_t>(source_size);
    
    if (size < TagConstants::ID3V2_HEADER_SIZE) {
        throw TagException(ParseError::InputTooShort,
                           "input of " + std::to_string(size) + " bytes cannot hold a tag");
    }
    
    uint8_t header[TagConstants::ID3V2_HEADER_SIZE];
    source.readAt(0, header, sizeof(header));
    
    std::unique_ptr<ID3v2Tag> v2;
    std::optional<TagException> v2_error;
    size_t container_end = 0;
    
    if (std::memcmp(header, "ID3", 3) == 0) {
        try {
            size_t tag_size = ID3v2Tag::getTagSize(header);
            container_end = std::min(tag_size, size);
            
            std::vector<uint8_t> buffer(container_end);
            source.readAt(0, buffer.data(), buffer.size());
            v2 = ID3v2Tag::parse(buffer.data(), buffer.size());
        } catch (const IOException&) {
            throw;
        } catch (const TagException& e) {
            DEBUG_LOG("tag", "ID3v2 failed: ", e.what());
            v2_error = e;
        }
    }
    
    // The trailer is only looked for outside the container
    std::unique_ptr<ID3v1Tag> v1;
    if (size >= TagConstants::ID3V1_SIZE && size - TagConstants::ID3V1_SIZE >= container_end) {
        uint8_t trailer[TagConstants::ID3V1_SIZE];
        source.readAt(static_cast<off_t>(size - TagConstants::ID3V1_SIZE), trailer, sizeof(trailer));
        v1 = ID3v1Tag::parse(trailer);
    }
    
    if (v2_error && !v1) {
        throw *v2_error;
    }
    if (!v1 && !v2) {
        throw TagException(ParseError::NoTag, "no ID3v1 or ID3v2 tag found");
    }
    
    Metadata metadata = TagAggregator::aggregate(v1.get(), v2.get());
    if (v2_error) {
        metadata.m_warnings.insert(metadata.m_warnings.begin(),
                                   ParseWarning{v2_error->code(), "", 0,
                                                std::string("ID3v2 tag ignored: ") + v2_error->what()});
    }
    
    return metadata;
}

} // namespace Tag
} // namespace ID3Peek
