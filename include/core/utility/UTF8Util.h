/*
 * UTF8Util.h - UTF-8 conversion helpers for tag text
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_CORE_UTILITY_UTF8UTIL_H
#define ID3PEEK_CORE_UTILITY_UTF8UTIL_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace ID3Peek {
namespace Core {
namespace Utility {

/**
 * @brief UTF-8 conversion helpers
 * 
 * All text handed out by ID3Peek is UTF-8. These helpers convert the
 * character sets ID3 tags are stored in:
 * - ISO-8859-1 (Latin-1) -> UTF-8
 * - UTF-16 (LE/BE/BOM) -> UTF-8
 * - UTF-8 -> validated UTF-8
 * 
 * Malformed input never fails: each bad code unit becomes U+FFFD.
 * 
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    // ========================================================================
    // UTF-8 Validation
    // ========================================================================
    
    /**
     * @brief Check if a byte range is valid UTF-8
     */
    static bool isValid(const uint8_t* data, size_t size);
    static bool isValid(const std::string& text);
    
    /**
     * @brief Replace every invalid sequence with U+FFFD
     */
    static std::string repair(const std::string& text);
    
    /**
     * @brief Decode UTF-8 bytes up to the first NUL, repairing as needed
     */
    static std::string decodeSafe(const uint8_t* data, size_t size);
    
    // ========================================================================
    // Legacy character sets
    // ========================================================================
    
    /**
     * @brief Convert ISO-8859-1 to UTF-8, stopping at the first NUL
     * 
     * Every byte maps to the code point of the same value.
     */
    static std::string fromLatin1(const uint8_t* data, size_t size);
    
    // ========================================================================
    // UTF-16
    // ========================================================================
    
    /**
     * @brief Convert UTF-16LE to UTF-8, stopping at the first 0x0000 unit
     * 
     * Unpaired surrogates and a dangling odd byte become U+FFFD.
     */
    static std::string fromUTF16LE(const uint8_t* data, size_t size);
    
    /**
     * @brief Convert UTF-16BE to UTF-8, stopping at the first 0x0000 unit
     */
    static std::string fromUTF16BE(const uint8_t* data, size_t size);
    
    /**
     * @brief Convert UTF-16 with an optional byte order mark to UTF-8
     * 
     * FF FE selects little endian, FE FF big endian. Without a BOM the
     * data is read as big endian.
     */
    static std::string fromUTF16BOM(const uint8_t* data, size_t size);
    
    // ========================================================================
    // Code points
    // ========================================================================
    
    /**
     * @brief Decode one code point from UTF-8 bytes
     * @param bytesConsumed Set to the length of the sequence read (at least 1)
     * @return The code point, or 0xFFFD for an invalid sequence
     */
    static uint32_t decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed);
    
    static std::string encodeCodepoint(uint32_t codepoint);
    static void appendCodepoint(std::string& output, uint32_t codepoint);
    static bool isValidCodepoint(uint32_t codepoint);
    
    /**
     * @brief Find the first NUL unit of the given width
     * @param bytesPerUnit 1 or 2; 2-byte units are only matched on even offsets
     * @return Offset of the terminator, or size if there is none
     */
    static size_t findNullTerminator(const uint8_t* data, size_t size, size_t bytesPerUnit = 1);
    
    /**
     * @brief Get the UTF-8 replacement character (U+FFFD)
     */
    static const std::string& replacementCharacter();

private:
    static std::string fromUTF16(const uint8_t* data, size_t size, bool bigEndian);
};

} // namespace Utility
} // namespace Core
} // namespace ID3Peek

#endif // ID3PEEK_CORE_UTILITY_UTF8UTIL_H
