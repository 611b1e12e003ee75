/*
 * ID3v1Tag.h - ID3v1/ID3v1.1 tag reader
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V1TAG_H
#define ID3PEEK_TAG_ID3V1TAG_H

#include "tag/Tag.h"
#include <memory>

namespace ID3Peek {
namespace Tag {

/**
 * @brief ID3v1/ID3v1.1 tag reader
 * 
 * ID3v1 is a simple fixed-size metadata format appended to MP3 files.
 * The tag is exactly 128 bytes and contains:
 * - 3 bytes: "TAG" identifier
 * - 30 bytes: Title
 * - 30 bytes: Artist
 * - 30 bytes: Album
 * - 4 bytes: Year
 * - 30 bytes: Comment (28 bytes + null + track in ID3v1.1)
 * - 1 byte: Genre index
 * 
 * ID3v1.1 extends ID3v1 by using the last two bytes of the comment field
 * to store a track number (byte 28 = 0x00, byte 29 = track number).
 * 
 * Text is ISO-8859-1 and is converted to UTF-8.
 */
class ID3v1Tag : public Tag {
public:
    /// ID3v1 tag size in bytes
    static constexpr size_t TAG_SIZE = 128;
    
    /// Number of genres in the ID3v1 genre list (including Winamp extensions)
    static constexpr size_t GENRE_COUNT = 192;
    
    /**
     * @brief Parse ID3v1 tag from raw data
     * @param data Pointer to 128 bytes of ID3v1 data
     * @return Unique pointer to ID3v1Tag, or nullptr if the "TAG" marker is absent
     */
    static std::unique_ptr<ID3v1Tag> parse(const uint8_t* data);
    
    /**
     * @brief Check if data starts with the "TAG" marker
     * @param data Pointer to at least 3 bytes of data
     */
    static bool isValid(const uint8_t* data);
    
    /**
     * @brief Get genre name from genre index
     * @param index Genre index
     * @return Genre name, or "Unknown" for 255 and indices past the list
     */
    static std::string genreFromIndex(uint8_t index);
    
    ID3v1Tag() = default;
    ~ID3v1Tag() override = default;
    
    // Non-copyable
    ID3v1Tag(const ID3v1Tag&) = delete;
    ID3v1Tag& operator=(const ID3v1Tag&) = delete;
    
    // ========================================================================
    // Tag interface implementation
    // ========================================================================
    
    std::optional<std::string> getField(CommonField field) const override;
    std::vector<CommentEntry> comments() const override;
    std::vector<CommentEntry> lyrics() const override { return {}; }
    const std::vector<Picture>& pictures() const override;
    std::string formatName() const override;
    
    // ========================================================================
    // ID3v1-specific methods
    // ========================================================================
    
    /**
     * @brief Check if this is an ID3v1.1 tag (has track number)
     */
    bool isID3v1_1() const { return m_is_v1_1; }
    
    /**
     * @brief Track number from ID3v1.1, 0 if absent
     */
    uint8_t trackNumber() const { return m_track; }
    
    /**
     * @brief Get the raw genre index (255 = none)
     */
    uint8_t genreIndex() const { return m_genre_index; }
    
private:
    std::string m_title;
    std::string m_artist;
    std::string m_album;
    std::string m_year;
    std::string m_comment;
    uint8_t m_track = 0;
    uint8_t m_genre_index = 255;
    bool m_is_v1_1 = false;
    
    /**
     * @brief Read a fixed-width Latin-1 field as UTF-8
     *
     * Stops at the first NUL, then drops trailing spaces and NULs.
     */
    static std::string readField(const uint8_t* data, size_t width);
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V1TAG_H
