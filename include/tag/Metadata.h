/*
 * Metadata.h - Aggregated view of the tags found in a file
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_METADATA_H
#define ID3PEEK_TAG_METADATA_H

#include "tag/Tag.h"
#include "tag/ID3v2Frame.h"

namespace ID3Peek {
namespace Tag {

class TagAggregator;
class TagReader;

/**
 * @brief Merged result of reading every tag in a file
 * 
 * Built by TagAggregator; immutable afterwards. Common fields prefer
 * ID3v2 and fall back to ID3v1. Comments, lyrics, pictures and frames
 * come from ID3v2 only.
 */
class Metadata : public Tag {
public:
    Metadata() = default;
    ~Metadata() override = default;
    
    // ========================================================================
    // Tag interface implementation
    // ========================================================================
    
    std::optional<std::string> getField(CommonField field) const override;
    std::vector<CommentEntry> comments() const override { return m_comments; }
    std::vector<CommentEntry> lyrics() const override { return m_lyrics; }
    const std::vector<Picture>& pictures() const override { return m_pictures; }
    
    /**
     * @return e.g. "ID3v2.3 + ID3v1.1", "ID3v2.4", "ID3v1"
     */
    std::string formatName() const override;
    
    // ========================================================================
    // Convenience accessors
    // ========================================================================
    
    std::optional<std::string> field(CommonField field) const { return getField(field); }
    
    /**
     * @brief Present common fields keyed by display name ("Title", "Album artist")
     */
    std::map<std::string, std::string> fields() const { return getAllFields(); }
    
    /**
     * @return Pointer into pictures(), or nullptr when index is out of range
     */
    const Picture* picture(size_t index) const;
    
    const std::vector<DecodedFrame>& frames() const { return m_frames; }
    const std::vector<ParseWarning>& warnings() const { return m_warnings; }
    
    /**
     * @brief Identifiers of the decoded frames, first appearance order, no repeats
     */
    std::vector<std::string> frameIds() const;
    
    bool hasID3v1() const { return !m_id3v1_format.empty(); }
    bool hasID3v2() const { return !m_id3v2_format.empty(); }
    
private:
    friend class TagAggregator;
    friend class TagReader;
    
    std::map<CommonField, std::string> m_fields;
    std::vector<CommentEntry> m_comments;
    std::vector<CommentEntry> m_lyrics;
    std::vector<Picture> m_pictures;
    std::vector<DecodedFrame> m_frames;
    std::vector<ParseWarning> m_warnings;
    std::string m_id3v1_format;
    std::string m_id3v2_format;
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_METADATA_H
