/*
 * FileIOHandler.h - Local file IOHandler implementation
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_IO_FILE_FILEIOHANDLER_H
#define ID3PEEK_IO_FILE_FILEIOHANDLER_H

#include "io/IOHandler.h"
#include <memory>

namespace ID3Peek {
namespace IO {
namespace File {

/**
 * @brief IOHandler over a local file opened read-only
 */
class FileIOHandler : public IOHandler {
public:
    /**
     * @brief Open @p path in binary read mode
     * @throws IOException if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path);
    ~FileIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

    const std::string& path() const { return m_file_path; }

private:
    std::string m_file_path;
    std::unique_ptr<FILE, int (*)(FILE*)> m_file_handle;
    off_t m_cached_file_size = -1;
};

} // namespace File
} // namespace IO
} // namespace ID3Peek

#endif // ID3PEEK_IO_FILE_FILEIOHANDLER_H
