/*
 * Tag.h - Format-neutral metadata tag interface
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_TAG_H
#define ID3PEEK_TAG_TAG_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

#include "exceptions.h"

namespace ID3Peek {
namespace Tag {

/**
 * @brief Fields every tag format can answer
 */
enum class CommonField {
    Title,
    Artist,
    Album,
    Track,
    Year,
    Genre,
    Comment,
    AlbumArtist,
    Composer
};

/**
 * @brief Display name of a field, e.g. "Title" or "Album artist"
 */
const char* fieldName(CommonField field);

/**
 * @brief All fields in display order
 */
const std::vector<CommonField>& allCommonFields();

/**
 * @brief Picture type enumeration (ID3v2 APIC picture type byte)
 */
enum class PictureType : uint8_t {
    Other = 0,
    FileIcon = 1,
    OtherFileIcon = 2,
    FrontCover = 3,
    BackCover = 4,
    LeafletPage = 5,
    Media = 6,
    LeadArtist = 7,
    Artist = 8,
    Conductor = 9,
    Band = 10,
    Composer = 11,
    Lyricist = 12,
    RecordingLocation = 13,
    DuringRecording = 14,
    DuringPerformance = 15,
    MovieScreenCapture = 16,
    BrightColoredFish = 17,
    Illustration = 18,
    BandLogotype = 19,
    PublisherLogotype = 20
};

constexpr uint8_t PICTURE_TYPE_COUNT = 21;

/**
 * @brief Human-readable picture type, e.g. "Front cover"
 */
const char* pictureTypeName(PictureType type);

/**
 * @brief Parse a picture type from a number ("3") or a name
 *
 * Names are matched case-insensitively with spaces, dashes and
 * underscores ignored, so "front-cover", "Front cover" and "FrontCover"
 * all select PictureType::FrontCover.
 */
std::optional<PictureType> pictureTypeFromString(const std::string& text);

/**
 * @brief Embedded picture/artwork data
 */
struct Picture {
    PictureType type = PictureType::Other;
    std::string mime_type;
    std::string description;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t color_depth = 0;
    std::vector<uint8_t> data;
    
    bool isEmpty() const { return data.empty(); }
};

/**
 * @brief A language-tagged text entry (comment or unsynchronised lyrics)
 */
struct CommentEntry {
    std::string language;    // ISO-639-2 code, e.g. "eng"
    std::string description;
    std::string text;
};

/**
 * @brief Non-fatal problem found while reading a tag
 */
struct ParseWarning {
    ParseError code = ParseError::MalformedFrame;
    std::string frame_id;   // Empty for container-level problems
    size_t offset = 0;      // Byte offset from the start of the tag
    std::string message;
};

/**
 * @brief Abstract base class for format-neutral metadata access
 * 
 * Implemented by the individual ID3 readers and by the aggregated
 * Metadata view. Absent fields are std::nullopt, never empty strings.
 * 
 * Implementations are immutable after construction and therefore safe
 * for concurrent reads.
 */
class Tag {
public:
    virtual ~Tag() = default;
    
    // ========================================================================
    // Core metadata fields
    // ========================================================================
    
    /**
     * @brief Get a common field
     * @return The value, or nullopt if the tag does not carry it
     */
    virtual std::optional<std::string> getField(CommonField field) const = 0;
    
    std::optional<std::string> title() const { return getField(CommonField::Title); }
    std::optional<std::string> artist() const { return getField(CommonField::Artist); }
    std::optional<std::string> album() const { return getField(CommonField::Album); }
    std::optional<std::string> track() const { return getField(CommonField::Track); }
    std::optional<std::string> year() const { return getField(CommonField::Year); }
    std::optional<std::string> genre() const { return getField(CommonField::Genre); }
    std::optional<std::string> comment() const { return getField(CommonField::Comment); }
    std::optional<std::string> albumArtist() const { return getField(CommonField::AlbumArtist); }
    std::optional<std::string> composer() const { return getField(CommonField::Composer); }
    
    /**
     * @brief Get every present common field, keyed by display name
     */
    std::map<std::string, std::string> getAllFields() const;
    
    // ========================================================================
    // Free text and artwork
    // ========================================================================
    
    virtual std::vector<CommentEntry> comments() const = 0;
    virtual std::vector<CommentEntry> lyrics() const = 0;
    virtual const std::vector<Picture>& pictures() const = 0;
    
    /**
     * @brief Get the first picture of the given type
     * @return Pointer into pictures(), or nullptr
     */
    const Picture* findPicture(PictureType type) const;
    
    /**
     * @brief Get the front cover, or else the first picture
     * @return Pointer into pictures(), or nullptr if there are none
     */
    const Picture* frontCover() const;
    
    // ========================================================================
    // Metadata state
    // ========================================================================
    
    /**
     * @brief Check if any field, text entry or picture is present
     */
    virtual bool isEmpty() const;
    
    /**
     * @brief Get the underlying tag format name
     * @return Format name (e.g., "ID3v1.1", "ID3v2.4", "ID3v2.3 + ID3v1")
     */
    virtual std::string formatName() const = 0;
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_TAG_H
