/*
 * ID3v2Tag.h - ID3v2 tag container reader
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V2TAG_H
#define ID3PEEK_TAG_ID3V2TAG_H

#include "tag/Tag.h"
#include "tag/ID3v2Frame.h"
#include "tag/ID3v2FrameLayout.h"
#include <map>
#include <memory>

namespace ID3Peek {
namespace Tag {

/**
 * @brief The 10-byte ID3v2 tag header
 */
struct ID3v2Header {
    uint8_t major_version = 0;
    uint8_t minor_version = 0;
    uint8_t flags = 0;
    uint32_t size = 0;          // Body size, excluding header and footer
    
    bool unsynchronisation() const { return (flags & 0x80) != 0; }
    
    /**
     * @brief Extended header present (v2.3/v2.4); in v2.2 this bit means compression
     */
    bool extendedHeader() const { return (flags & 0x40) != 0; }
    bool experimental() const { return (flags & 0x20) != 0; }
    bool footer() const { return major_version == 4 && (flags & 0x10) != 0; }
};

/**
 * @brief Optional extended header (v2.3 and v2.4)
 *
 * Nothing in field extraction depends on it; it is kept for inspection.
 */
struct ID3v2ExtendedHeader {
    uint32_t size = 0;          // Total bytes occupied, size field included
    uint16_t flags = 0;         // v2.3: 2 flag bytes; v2.4: the single flag byte
    uint32_t padding_size = 0;  // v2.3 only
    bool update = false;        // v2.4 "tag is an update"
    std::optional<uint64_t> crc;           // CRC-32 (v2.4 stores it as 35-bit synchsafe)
    std::optional<uint8_t> restrictions;   // v2.4 restriction byte
};

/**
 * @brief ID3v2 tag reader
 * 
 * Supports ID3v2 versions 2.2, 2.3, and 2.4 with the following features:
 * - Tag-level and frame-level unsynchronisation
 * - Extended headers and the v2.4 footer
 * - Frame flag data (grouping, data length indicator), zlib compression
 * - Frame ID normalization (v2.2 3-char to v2.3+ 4-char)
 * - Typed decoding of text, comment, lyrics and picture frames
 * 
 * Damage inside the tag body does not fail the parse. Each problem is
 * recorded as a ParseWarning and the reader carries on with the next
 * frame it can find.
 * 
 * ## Thread Safety
 * 
 * Immutable after parse(); all accessors are const and safe to call
 * concurrently.
 */
class ID3v2Tag : public Tag {
public:
    /**
     * @brief Parse ID3v2 tag from raw data
     * 
     * @param data Pointer to ID3v2 data (starting with "ID3" header)
     * @param size Size of available data; a larger declared size is clamped
     * @return Unique pointer to ID3v2Tag, or nullptr if there is no "ID3" marker
     * @throws TagException (TruncatedHeader, UnsupportedRevision, InvalidSynchsafe)
     */
    static std::unique_ptr<ID3v2Tag> parse(const uint8_t* data, size_t size);
    
    /**
     * @brief Check if data starts with a usable ID3v2 header
     * 
     * Validates magic bytes, version and size bytes without throwing.
     */
    static bool isValid(const uint8_t* data, size_t size);
    
    /**
     * @brief Get total tag size from header
     * 
     * @param header Pointer to 10-byte ID3v2 header
     * @return Header + body + footer (when flagged) in bytes
     * @throws TagException (InvalidSynchsafe) for a malformed size field
     */
    static size_t getTagSize(const uint8_t* header);
    
    /**
     * @brief Decode the 10-byte header
     * @throws TagException (TruncatedHeader, UnsupportedRevision, InvalidSynchsafe)
     */
    static ID3v2Header parseHeader(const uint8_t* data, size_t size);
    
    /**
     * @brief Normalize frame ID from v2.2 to v2.3+ format
     * 
     * Converts 3-character v2.2 frame IDs to 4-character v2.3+ equivalents.
     * Unknown frame IDs are returned unchanged.
     * 
     * @param id Frame ID to normalize
     * @param version Major version (2, 3, or 4)
     * @return Normalized frame ID
     */
    static std::string normalizeFrameId(const std::string& id, uint8_t version);
    
    /**
     * @brief Resolve a TCON value to a genre name
     * 
     * Handles bare numbers ("17"), v2.3 references ("(17)", "(17)Refined")
     * and the "(RX)" / "(CR)" keywords. Anything else is returned as is.
     */
    static std::string resolveGenre(const std::string& value);
    
    ID3v2Tag() = default;
    ~ID3v2Tag() override = default;
    
    // Non-copyable but movable
    ID3v2Tag(const ID3v2Tag&) = delete;
    ID3v2Tag& operator=(const ID3v2Tag&) = delete;
    ID3v2Tag(ID3v2Tag&&) = default;
    ID3v2Tag& operator=(ID3v2Tag&&) = default;
    
    // ========================================================================
    // Tag interface implementation
    // ========================================================================
    
    std::optional<std::string> getField(CommonField field) const override;
    std::vector<CommentEntry> comments() const override;
    std::vector<CommentEntry> lyrics() const override;
    const std::vector<Picture>& pictures() const override { return m_pictures; }
    std::string formatName() const override;
    
    // ========================================================================
    // ID3v2-specific methods
    // ========================================================================
    
    const ID3v2Header& header() const { return m_header; }
    uint8_t majorVersion() const { return m_header.major_version; }
    uint8_t minorVersion() const { return m_header.minor_version; }
    
    /**
     * @brief Extended header, when one was present and readable
     */
    const std::optional<ID3v2ExtendedHeader>& extendedHeader() const { return m_extended_header; }
    
    /**
     * @brief Frames in tag order, payloads unwrapped
     */
    const std::vector<ID3v2Frame>& frames() const { return m_frames; }
    
    /**
     * @brief One decoded frame per entry of frames(), same order
     */
    const std::vector<DecodedFrame>& decodedFrames() const { return m_decoded_frames; }
    
    /**
     * @brief Problems found while reading, in the order they were found
     */
    const std::vector<ParseWarning>& warnings() const { return m_warnings; }
    
    /**
     * @brief Bytes of zero padding after the last frame
     */
    size_t paddingSize() const { return m_padding_size; }
    
    /**
     * @brief Get all frames with a specific ID
     * 
     * @param frame_id Frame ID (4-character, normalized)
     * @return Vector of frames with matching ID
     */
    std::vector<ID3v2Frame> getFrames(const std::string& frame_id) const;
    
    /**
     * @brief Get first frame with a specific ID
     * 
     * @return Pointer to first matching frame, or nullptr if not found
     */
    const ID3v2Frame* getFrame(const std::string& frame_id) const;
    
    /**
     * @brief Get all frame IDs present in the tag, in order of first appearance
     */
    std::vector<std::string> getFrameIds() const;
    
    /**
     * @brief Every value of every decoded text frame with this ID
     */
    std::vector<std::string> getTextValues(const std::string& frame_id) const;
    
private:
    ID3v2Header m_header;
    std::optional<ID3v2ExtendedHeader> m_extended_header;
    std::vector<ID3v2Frame> m_frames;
    std::vector<DecodedFrame> m_decoded_frames;
    std::vector<ParseWarning> m_warnings;
    std::vector<Picture> m_pictures;                 ///< Cached from PictureFrames
    size_t m_padding_size = 0;
    
    // ========================================================================
    // Internal parsing methods
    // ========================================================================
    
    void addWarning(ParseError code, const std::string& frame_id, size_t offset,
                    const std::string& message);
    
    /**
     * @brief Read the extended header (if any) and the frames after it
     * 
     * @param data Tag body, tag-level unsynchronisation already removed
     * @param size Size of the body
     */
    void parseBody(const uint8_t* data, size_t size);
    
    /**
     * @brief Parse the extended header at the start of the body
     * 
     * @return Bytes to skip before the first frame
     * @throws TagException when its size field cannot be trusted
     */
    size_t parseExtendedHeader(const uint8_t* data, size_t size);
    
    /**
     * @brief Frame loop
     * 
     * @param base_offset Offset of data from the start of the tag
     */
    void parseFrames(const uint8_t* data, size_t size, size_t base_offset);
    
    /**
     * @brief Work out the payload size of the frame whose header is at pos
     * 
     * @return false when no usable size exists and the loop has to resync
     */
    bool readFrameSize(const uint8_t* data, size_t size, size_t pos, size_t base_offset,
                       const ID3v2FrameLayout& layout, uint32_t& frame_size);
    
    /**
     * @brief Check whether a frame ending at end is followed by something sane
     * 
     * The end of the body, padding, or another frame identifier all qualify.
     */
    static bool isFrameBoundary(const uint8_t* data, size_t size, size_t end,
                                const ID3v2FrameLayout& layout);
    
    /**
     * @brief Scan forward for the next plausible frame header
     * 
     * @return Its position, or size if there is none
     */
    static size_t resync(const uint8_t* data, size_t size, size_t from,
                         const ID3v2FrameLayout& layout);
    
    /**
     * @brief Strip flag data, unsynchronisation and compression from a payload
     */
    void processFrame(ID3v2Frame& frame, const uint8_t* payload, size_t size,
                      const ID3v2FrameLayout& layout);
    
    /**
     * @brief Run the frame decoders and cache pictures
     */
    void decodeFrames();
    
    /**
     * @brief Check the v2.4 footer after the body
     */
    void checkFooter(const uint8_t* data, size_t size);
    
    /**
     * @brief First value of the first text frame with this ID, nullopt if empty
     */
    std::optional<std::string> getTextField(const std::string& frame_id) const;
    
    /**
     * @brief Comment text: the first COMM without a description, else the first COMM
     */
    std::optional<std::string> getCommentField() const;
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V2TAG_H
