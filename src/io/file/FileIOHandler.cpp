/*
 * FileIOHandler.cpp - Local file IOHandler implementation
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <cerrno>
#include <sys/stat.h>

namespace ID3Peek {
namespace IO {
namespace File {

/**
 * @brief Constructs a FileIOHandler for a given local file path.
 *
 * @param path The file path to open
 * @throws IOException if the file cannot be opened or is not a regular file
 */
FileIOHandler::FileIOHandler(const std::string& path)
    : m_file_path(path), m_file_handle(nullptr, &fclose) {
    Debug::log("io", "FileIOHandler::FileIOHandler() - Opening file: ", path);

    m_file_handle.reset(fopen(path.c_str(), "rb"));
    if (!m_file_handle) {
        m_error = errno;
        std::string errorMsg = getErrorMessage(m_error, "Could not open file: " + path);
        Debug::log("io", "FileIOHandler::FileIOHandler() - ", errorMsg);
        throw IOException(errorMsg);
    }

    struct stat file_stat;
    if (fstat(fileno(m_file_handle.get()), &file_stat) != 0) {
        m_error = errno;
        throw IOException(getErrorMessage(m_error, "Could not stat file: " + path));
    }
    if (!S_ISREG(file_stat.st_mode)) {
        m_error = EINVAL;
        throw IOException("Not a regular file: " + path);
    }
    m_cached_file_size = file_stat.st_size;

    Debug::log("io", "FileIOHandler::FileIOHandler() - Opened ", path, ", ", m_cached_file_size, " bytes");
}

FileIOHandler::~FileIOHandler() {
    // unique_ptr closes the handle
}

size_t FileIOHandler::read(void* buffer, size_t size, size_t count) {
    if (m_closed || !m_file_handle) {
        updateErrorState(EBADF);
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    updateErrorState(0);
    size_t got = fread(buffer, size, count, m_file_handle.get());
    if (got < count) {
        if (ferror(m_file_handle.get())) {
            updateErrorState(errno ? errno : EIO, "FileIOHandler::read() - fread failed");
            clearerr(m_file_handle.get());
        } else {
            m_eof = true;
        }
    }
    return got;
}

int FileIOHandler::seek(off_t offset, int whence) {
    if (m_closed || !m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    if (fseeko(m_file_handle.get(), offset, whence) != 0) {
        updateErrorState(errno, "FileIOHandler::seek() - fseeko failed");
        return -1;
    }

    updateErrorState(0);
    m_eof = false;
    return 0;
}

off_t FileIOHandler::tell() {
    if (m_closed || !m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t position = ftello(m_file_handle.get());
    if (position < 0) {
        updateErrorState(errno, "FileIOHandler::tell() - ftello failed");
    }
    return position;
}

int FileIOHandler::close() {
    if (m_closed) {
        return 0;
    }
    m_closed = true;
    FILE* handle = m_file_handle.release();
    if (handle && fclose(handle) != 0) {
        updateErrorState(errno, "FileIOHandler::close() - fclose failed");
        return m_error;
    }
    return 0;
}

bool FileIOHandler::eof() {
    return m_closed || !m_file_handle || m_eof;
}

/**
 * @brief Get total size of the file in bytes.
 *
 * Cached from fstat() when the file was opened.
 */
off_t FileIOHandler::getFileSize() {
    if (m_closed) {
        return -1;
    }
    return m_cached_file_size;
}

} // namespace File
} // namespace IO
} // namespace ID3Peek
