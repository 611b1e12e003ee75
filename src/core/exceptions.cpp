/*
 * exceptions.cpp - Exception class implementations.
 * This file is part of ID3Peek.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

namespace ID3Peek {

const char* errorName(ParseError code) noexcept {
    switch (code) {
        case ParseError::NotPresent:          return "NotPresent";
        case ParseError::UnsupportedRevision: return "UnsupportedRevision";
        case ParseError::InvalidSynchsafe:    return "InvalidSynchsafe";
        case ParseError::TruncatedData:       return "TruncatedData";
        case ParseError::TruncatedHeader:     return "TruncatedHeader";
        case ParseError::UnsupportedEncoding: return "UnsupportedEncoding";
        case ParseError::MalformedFrame:      return "MalformedFrame";
        case ParseError::InputTooShort:       return "InputTooShort";
        case ParseError::NoTag:               return "NoTag";
        case ParseError::IOError:             return "IOError";
    }
    return "Unknown";
}

/**
 * @brief Constructs a TagException.
 *
 * Thrown when tag data is present but cannot be interpreted at all, e.g.
 * an ID3v2 header naming a revision this reader does not implement.
 * @param code The failure category.
 * @param why A string describing the reason for the failure.
 */
TagException::TagException(ParseError code, std::string why)
    : std::exception(), m_code(code), m_why(std::move(why)) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing why the tag could not be read.
 */
const char *TagException::what() const noexcept {
  return m_why.c_str();
}

/**
 * @brief Constructs an IOException.
 *
 * Thrown by byte sources when the underlying file cannot be opened, sought
 * or read.
 * @param why A string describing the I/O failure.
 */
IOException::IOException(std::string why)
    : TagException(ParseError::IOError, std::move(why)) {
  // ctor
}

} // namespace ID3Peek
