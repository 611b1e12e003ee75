/*
 * ID3v2Utils.h - ID3v2 utility functions
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V2UTILS_H
#define ID3PEEK_TAG_ID3V2UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ID3Peek {
namespace Tag {
namespace ID3v2Utils {

/**
 * @brief ID3v2 text encoding types
 */
enum class TextEncoding : uint8_t {
    ISO_8859_1 = 0,  // Latin-1
    UTF_16_BOM = 1,  // UTF-16 with BOM
    UTF_16_BE = 2,   // UTF-16 Big Endian (no BOM)
    UTF_8 = 3        // UTF-8
};

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

/**
 * @brief Check if a value can be encoded as synchsafe (fits in 28 bits)
 * 
 * @param value Value to check
 * @return true if value <= 0x0FFFFFFF
 */
bool canEncodeSynchsafe(uint32_t value);

/**
 * @brief Encode a 28-bit value as a synchsafe integer
 * 
 * Synchsafe integers are used in ID3v2 to avoid false sync patterns.
 * Each byte uses only 7 bits (MSB is always 0), allowing 28 bits
 * of data to be stored in 4 bytes.
 * 
 * @param value Value to encode
 * @return 4-byte synchsafe encoded value
 * @throws std::out_of_range if value does not fit in 28 bits
 */
uint32_t encodeSynchsafe(uint32_t value);

/**
 * @brief Decode a synchsafe integer to a regular 28-bit value
 * 
 * @param synchsafe 4-byte synchsafe encoded value
 * @return Decoded value (28-bit)
 * @throws TagException (InvalidSynchsafe) if any byte has its high bit set
 */
uint32_t decodeSynchsafe(uint32_t synchsafe);

/**
 * @brief Decode synchsafe integer from raw bytes
 * 
 * @param data Pointer to 4 bytes of synchsafe data
 * @return Decoded value (28-bit)
 * @throws TagException (InvalidSynchsafe) if any byte has its high bit set
 */
uint32_t decodeSynchsafeBytes(const uint8_t* data);

/**
 * @brief Decode a synchsafe integer of arbitrary width (up to 9 bytes)
 *
 * Used for the 35-bit CRC of the ID3v2.4 extended header.
 * @throws TagException (InvalidSynchsafe) if any byte has its high bit set
 */
uint64_t decodeSynchsafeWide(const uint8_t* data, size_t count);

/**
 * @brief Encode synchsafe integer to raw bytes
 * 
 * @param value Value to encode
 * @param out Output buffer (must be at least 4 bytes)
 * @throws std::out_of_range if value does not fit in 28 bits
 */
void encodeSynchsafeBytes(uint32_t value, uint8_t* out);

/**
 * @brief Check that none of @p count bytes has its high bit set
 */
bool isSynchsafe(const uint8_t* data, size_t count = 4);

/**
 * @brief Read a plain big-endian unsigned integer of 1 to 4 bytes
 */
uint32_t readBigEndian(const uint8_t* data, size_t count);

// ============================================================================
// Unsynchronization Functions
// ============================================================================

/**
 * @brief Decode unsynchronized data
 * 
 * ID3v2 unsynchronization inserts 0x00 after every 0xFF that could be
 * mistaken for an MPEG sync. This function reverses that process.
 * 
 * @param data Pointer to unsynchronized data
 * @param size Size of data
 * @return Decoded data with 0xFF 0x00 sequences restored to 0xFF
 */
std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size);

// ============================================================================
// Text Encoding Functions
// ============================================================================

/**
 * @brief Validate an encoding byte
 * @throws TagException (UnsupportedEncoding) for values above 3
 */
TextEncoding encodingFromByte(uint8_t value);

/**
 * @brief Name of an encoding for diagnostics, e.g. "UTF-16BE"
 */
const char* encodingName(TextEncoding encoding);

/**
 * @brief Get the null terminator size for a given encoding
 * 
 * @return 1 for ISO-8859-1/UTF-8, 2 for UTF-16 variants
 */
size_t getNullTerminatorSize(TextEncoding encoding);

/**
 * @brief Find null terminator position in encoded text
 * 
 * UTF-16 terminators are only recognised on even offsets.
 * 
 * @return Position of null terminator, or size if not found
 */
size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Decode every null-separated value of an ID3v2 text payload
 * 
 * Handles all ID3v2 text encodings:
 * - 0x00: ISO-8859-1 (Latin-1)
 * - 0x01: UTF-16 with BOM (a value without BOM keeps the previous byte order)
 * - 0x02: UTF-16 Big Endian (no BOM)
 * - 0x03: UTF-8
 * 
 * A missing final terminator is accepted. Trailing empty values
 * (terminators and padding) are dropped.
 * 
 * @param data Pointer to text data (after encoding byte)
 * @param size Size of text data
 * @param encoding Text encoding type
 * @return UTF-8 encoded values
 */
std::vector<std::string> decodeTextValues(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Decode the first value of an ID3v2 text payload to UTF-8
 */
std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Decode one terminated string and report how far it reached
 * 
 * @param consumed Set to the bytes used, including the terminator when
 *        one was found
 * @return UTF-8 encoded string
 */
std::string readTerminatedString(const uint8_t* data, size_t size,
                                 TextEncoding encoding, size_t& consumed);

} // namespace ID3v2Utils
} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V2UTILS_H
