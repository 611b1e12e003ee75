/*
 * IOHandler.h - Abstract byte source interface
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_IO_IOHANDLER_H
#define ID3PEEK_IO_IOHANDLER_H

#include <cstddef>
#include <cstdio>
#include <string>
#include <sys/types.h>

namespace ID3Peek {
namespace IO {

/**
 * @brief Abstract base class for seekable byte sources
 *
 * The interface follows fread()/fseeko() semantics so that tag readers can
 * consume files and memory buffers alike. Implementations report failures
 * through return values and getLastError(); they do not throw from read
 * or seek.
 */
class IOHandler {
public:
    IOHandler() = default;
    virtual ~IOHandler() = default;

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read data from the source
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count) = 0;

    /**
     * @brief Seek to a position in the source
     * @param offset Offset to seek to
     * @param whence SEEK_SET, SEEK_CUR, or SEEK_END positioning mode
     * @return 0 on success, -1 on failure
     */
    virtual int seek(off_t offset, int whence) = 0;

    /**
     * @brief Get current byte offset position
     * @return Current position, -1 on failure
     */
    virtual off_t tell() = 0;

    /**
     * @brief Close the source and release resources
     * @return 0 on success, an errno value on failure
     */
    virtual int close() = 0;

    virtual bool eof() = 0;

    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown
     */
    virtual off_t getFileSize() = 0;

    /**
     * @brief Get the last error code
     * @return errno-style error code (0 = no error)
     */
    int getLastError() const { return m_error; }

    /**
     * @brief Read exactly @p size bytes at @p offset
     * @throws IOException if the seek fails or fewer bytes are available
     */
    void readAt(off_t offset, void* buffer, size_t size);

protected:
    /**
     * @brief Convert an errno value to a message with optional context
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");

    void updateErrorState(int error_code, const std::string& error_message = "");

    bool m_closed = false;
    bool m_eof = false;
    int m_error = 0;
};

} // namespace IO
} // namespace ID3Peek

#endif // ID3PEEK_IO_IOHANDLER_H
