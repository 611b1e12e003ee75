/*
 * exceptions.h - Exception classes and parse error codes.
 * This file is part of ID3Peek.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_EXCEPTIONS_H
#define ID3PEEK_EXCEPTIONS_H

#include <exception>
#include <ostream>
#include <string>

namespace ID3Peek {

/**
 * @brief Failure categories shared by exceptions and parse warnings
 */
enum class ParseError {
    NotPresent,          // No tag at the probed location
    UnsupportedRevision, // ID3v2 major version outside {2, 3, 4}
    InvalidSynchsafe,    // Synchsafe byte with the high bit set
    TruncatedData,       // Declared size runs past the available bytes
    TruncatedHeader,     // Fewer bytes than a fixed-size header needs
    UnsupportedEncoding, // Text encoding byte greater than 3
    MalformedFrame,      // Structurally invalid frame
    InputTooShort,       // Input cannot hold any tag region
    NoTag,               // Neither ID3v1 nor ID3v2 could be interpreted
    IOError              // The byte source failed
};

/**
 * @brief Stable name of an error code, e.g. "InvalidSynchsafe"
 */
const char* errorName(ParseError code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ParseError code) {
    return os << errorName(code);
}

// Tag data could not be interpreted. Carries the failure category.
class TagException : public std::exception
{
    public:
        TagException(ParseError code, std::string why);
        ~TagException() noexcept override = default;
        const char *what() const noexcept override;
        ParseError code() const noexcept { return m_code; }
    protected:
    private:
        ParseError m_code;
        std::string m_why;
};

// The byte source itself failed (open, seek or read).
class IOException : public TagException
{
    public:
        explicit IOException(std::string why);
        ~IOException() noexcept override = default;
};

} // namespace ID3Peek

#endif // ID3PEEK_EXCEPTIONS_H
