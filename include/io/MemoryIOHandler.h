/*
 * MemoryIOHandler.h - Memory-based IOHandler implementation
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_IO_MEMORYIOHANDLER_H
#define ID3PEEK_IO_MEMORYIOHANDLER_H

#include "io/IOHandler.h"
#include <cstdint>
#include <vector>

namespace ID3Peek {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Allows reading from a memory buffer as if it were a file.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @brief Construct from existing data (copy or reference)
     * @param data Pointer to data
     * @param size Size of data
     * @param copy If true, copies data to internal buffer. If false, references external data (must remain valid).
     */
    MemoryIOHandler(const void* data, size_t size, bool copy = true);

    /**
     * @brief Take ownership of a buffer
     */
    explicit MemoryIOHandler(std::vector<uint8_t> buffer);

    ~MemoryIOHandler() override = default;

    // IOHandler interface
    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

private:
    const uint8_t* data() const;
    size_t size() const;

    std::vector<uint8_t> m_buffer;
    const uint8_t* m_external_data = nullptr;
    size_t m_external_size = 0;
    bool m_own_buffer = true;
    size_t m_pos = 0;
};

} // namespace IO
} // namespace ID3Peek

#endif // ID3PEEK_IO_MEMORYIOHANDLER_H
