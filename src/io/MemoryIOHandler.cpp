/*
 * MemoryIOHandler.cpp - Memory-based IOHandler implementation
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <cerrno>

namespace ID3Peek {
namespace IO {

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_own_buffer(copy), m_pos(0) {
    if (copy) {
        if (data && size > 0) {
            m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
        }
    } else {
        m_external_data = static_cast<const uint8_t*>(data);
        m_external_size = data ? size : 0;
    }
}

MemoryIOHandler::MemoryIOHandler(std::vector<uint8_t> buffer)
    : m_buffer(std::move(buffer)), m_own_buffer(true), m_pos(0) {
}

const uint8_t* MemoryIOHandler::data() const {
    return m_own_buffer ? m_buffer.data() : m_external_data;
}

size_t MemoryIOHandler::size() const {
    return m_own_buffer ? m_buffer.size() : m_external_size;
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    updateErrorState(0);
    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;

    size_t total = this->size();
    size_t available = m_pos < total ? total - m_pos : 0;
    // Whole elements only, as fread() does
    size_t to_read = std::min(bytes_requested, available) / size * size;

    if (to_read > 0) {
        std::memcpy(buffer, data() + m_pos, to_read);
        m_pos += to_read;
    }

    m_eof = m_pos >= total;
    return to_read / size;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_pos;
    switch (whence) {
        case SEEK_SET:
            new_pos = offset;
            break;
        case SEEK_CUR:
            new_pos = static_cast<off_t>(m_pos) + offset;
            break;
        case SEEK_END:
            new_pos = static_cast<off_t>(size()) + offset;
            break;
        default:
            updateErrorState(EINVAL, "MemoryIOHandler::seek() - bad whence");
            return -1;
    }

    if (new_pos < 0) {
        updateErrorState(EINVAL, "MemoryIOHandler::seek() - negative position");
        return -1;
    }

    // Seeking past the end is allowed; read() then returns 0
    m_pos = static_cast<size_t>(new_pos);
    m_eof = m_pos >= size();
    updateErrorState(0);
    return 0;
}

off_t MemoryIOHandler::tell() {
    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }
    return static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    m_closed = true;
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_external_data = nullptr;
    m_external_size = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    return m_closed || m_pos >= size();
}

off_t MemoryIOHandler::getFileSize() {
    if (m_closed) {
        return -1;
    }
    return static_cast<off_t>(size());
}

} // namespace IO
} // namespace ID3Peek
