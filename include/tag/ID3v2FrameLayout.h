/*
 * ID3v2FrameLayout.h - Per-revision ID3v2 frame header layouts
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_ID3V2FRAMELAYOUT_H
#define ID3PEEK_TAG_ID3V2FRAMELAYOUT_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace ID3Peek {
namespace Tag {

/**
 * @brief Frame flags decoded to revision-independent form
 */
struct ID3v2FrameFlags {
    bool tag_alter_preservation = false;
    bool file_alter_preservation = false;
    bool read_only = false;
    bool grouping = false;
    bool compression = false;
    bool encryption = false;
    bool unsynchronisation = false;      // v2.4 only
    bool data_length_indicator = false;  // v2.4 only
};

/**
 * @brief Frame header shape of one ID3v2 revision
 *
 * | Revision | Header | Id | Size                     | Flags   |
 * |----------|--------|----|--------------------------|---------|
 * | 2.2      | 6      | 3  | 24-bit big endian        | none    |
 * | 2.3      | 10     | 4  | 32-bit big endian        | 2 bytes |
 * | 2.4      | 10     | 4  | 28-bit synchsafe         | 2 bytes |
 *
 * There is exactly one instance per revision; the tag reader picks it
 * once from the header's major version and uses it for every frame.
 */
class ID3v2FrameLayout {
public:
    /**
     * @brief Get the layout for a major version
     * @throws TagException (UnsupportedRevision) for anything but 2, 3 and 4
     */
    static const ID3v2FrameLayout& forVersion(uint8_t major_version);
    
    uint8_t version() const { return m_version; }
    size_t headerSize() const { return m_header_size; }
    size_t idLength() const { return m_id_length; }
    bool synchsafeSizes() const { return m_synchsafe_sizes; }
    bool hasFlags() const { return m_size_length == 4; }
    
    /**
     * @brief Check that the identifier at @p header consists of A-Z and 0-9
     */
    bool hasValidId(const uint8_t* header) const;
    
    std::string readId(const uint8_t* header) const;
    
    /**
     * @brief Read the frame size in this revision's encoding
     * @throws TagException (InvalidSynchsafe) for a v2.4 size with a high bit set
     */
    uint32_t readSize(const uint8_t* header) const;
    
    /**
     * @brief Read the size bytes as a plain big-endian integer
     *
     * Some writers store v2.4 frame sizes this way.
     */
    uint32_t readPlainSize(const uint8_t* header) const;
    
    /**
     * @brief Raw flag bytes, 0 for revisions without flags
     */
    uint16_t readFlags(const uint8_t* header) const;
    
    ID3v2FrameFlags decodeFlags(uint16_t flags) const;
    
private:
    constexpr ID3v2FrameLayout(uint8_t version, size_t id_length, size_t size_length,
                               bool synchsafe_sizes)
        : m_version(version), m_header_size(id_length + size_length + (size_length == 4 ? 2 : 0)),
          m_id_length(id_length), m_size_length(size_length),
          m_synchsafe_sizes(synchsafe_sizes) {}
    
    uint8_t m_version;
    size_t m_header_size;
    size_t m_id_length;
    size_t m_size_length;
    bool m_synchsafe_sizes;
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_ID3V2FRAMELAYOUT_H
