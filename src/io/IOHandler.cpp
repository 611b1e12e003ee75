/*
 * IOHandler.cpp - Abstract byte source interface
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

void IOHandler::readAt(off_t offset, void* buffer, size_t size) {
    if (seek(offset, SEEK_SET) != 0) {
        throw IOException(getErrorMessage(m_error ? m_error : EINVAL,
                                          "seek to " + std::to_string(offset) + " failed"));
    }
    if (size == 0) {
        return;
    }
    size_t got = read(buffer, 1, size);
    if (got != size) {
        std::string context = "short read at " + std::to_string(offset) + " (" +
                              std::to_string(got) + " of " + std::to_string(size) + " bytes)";
        if (m_error != 0) {
            throw IOException(getErrorMessage(m_error, context));
        }
        throw IOException(context);
    }
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message;
    
    if (!context.empty()) {
        message = context + ": ";
    }
    
    const char* error_str = strerror(error_code);
    if (error_str) {
        message += error_str;
    } else {
        message += "Unknown error " + std::to_string(error_code);
    }
    
    return message;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error = error_code;
    if (error_code != 0 && !error_message.empty()) {
        Debug::log("io", "IOHandler::updateErrorState() - ", getErrorMessage(error_code, error_message));
    }
}

} // namespace IO
} // namespace ID3Peek
