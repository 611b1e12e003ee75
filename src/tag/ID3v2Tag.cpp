/*
 * ID3v2Tag.cpp - ID3v2 tag container reader
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <cctype>
#include <cstring>

namespace ID3Peek {
namespace Tag {

using Core::Compression::ZlibDecompressor;

// ============================================================================
// Static factory methods
// ============================================================================

std::unique_ptr<ID3v2Tag> ID3v2Tag::parse(const uint8_t* data, size_t size) {
    if (!data || size < 3 || std::memcmp(data, "ID3", 3) != 0) {
        Debug::log("id3v2", "ID3v2Tag::parse: no ID3 marker");
        return nullptr;
    }
    
    auto tag = std::make_unique<ID3v2Tag>();
    tag->m_header = parseHeader(data, size);
    const ID3v2Header& header = tag->m_header;
    
    size_t available = size - TagConstants::ID3V2_HEADER_SIZE;
    size_t body_size = header.size;
    if (body_size > available) {
        tag->addWarning(ParseError::TruncatedData, "", TagConstants::ID3V2_HEADER_SIZE,
                        "declared tag size " + std::to_string(body_size) + " exceeds the " +
                        std::to_string(available) + " bytes available");
        body_size = available;
    }
    
    const uint8_t* body = data + TagConstants::ID3V2_HEADER_SIZE;
    
    if (header.major_version == 2 && header.extendedHeader()) {
        // No compression scheme was ever defined for v2.2
        tag->addWarning(ParseError::MalformedFrame, "", 5,
                        "ID3v2.2 compression flag set; tag body cannot be interpreted");
        return tag;
    }
    
    if (header.major_version < 4 && header.unsynchronisation()) {
        std::vector<uint8_t> resynced = ID3v2Utils::decodeUnsync(body, body_size);
        Debug::log("id3v2", "ID3v2Tag::parse: removed tag-level unsynchronisation, ",
                   body_size, " -> ", resynced.size(), " bytes");
        tag->parseBody(resynced.data(), resynced.size());
    } else {
        tag->parseBody(body, body_size);
    }
    
    if (header.footer()) {
        tag->checkFooter(data, size);
    }
    
    tag->decodeFrames();
    
    Debug::log("id3v2", "ID3v2Tag::parse: parsed ", tag->formatName(), " tag with ",
               tag->m_frames.size(), " frames, ", tag->m_warnings.size(), " warnings");
    
    return tag;
}

bool ID3v2Tag::isValid(const uint8_t* data, size_t size) {
    if (!data || size < TagConstants::ID3V2_HEADER_SIZE) {
        return false;
    }
    
    // Check magic bytes "ID3"
    if (data[0] != 'I' || data[1] != 'D' || data[2] != '3') {
        return false;
    }
    
    // Check version (support 2.2, 2.3, 2.4)
    uint8_t major_version = data[3];
    if (major_version < 2 || major_version > 4 || data[4] == 0xFF) {
        return false;
    }
    
    return ID3v2Utils::isSynchsafe(data + 6);
}

size_t ID3v2Tag::getTagSize(const uint8_t* header) {
    uint32_t body_size = ID3v2Utils::decodeSynchsafeBytes(header + 6);
    size_t total_size = TagConstants::ID3V2_HEADER_SIZE + body_size;
    
    // Footer flag only exists in v2.4
    if (header[3] == 4 && (header[5] & 0x10)) {
        total_size += TagConstants::ID3V2_FOOTER_SIZE;
    }
    
    return total_size;
}

// ============================================================================
// Header parsing implementation
// ============================================================================

ID3v2Header ID3v2Tag::parseHeader(const uint8_t* data, size_t size) {
    if (size < TagConstants::ID3V2_HEADER_SIZE) {
        throw TagException(ParseError::TruncatedHeader,
                           "ID3v2 header needs 10 bytes, only " + std::to_string(size) + " available");
    }
    
    ID3v2Header header;
    header.major_version = data[3];
    header.minor_version = data[4];
    header.flags = data[5];
    
    if (header.major_version < 2 || header.major_version > 4) {
        throw TagException(ParseError::UnsupportedRevision,
                           "unsupported ID3v2 revision 2." + std::to_string(header.major_version));
    }
    if (header.minor_version == 0xFF) {
        throw TagException(ParseError::UnsupportedRevision, "ID3v2 minor version 0xFF is reserved");
    }
    
    header.size = ID3v2Utils::decodeSynchsafeBytes(data + 6);
    
    // Undefined flag bits are reported, not acted upon
    static const uint8_t defined_flags[] = {0xC0, 0xE0, 0xF0};
    uint8_t undefined = header.flags & static_cast<uint8_t>(~defined_flags[header.major_version - 2]);
    if (undefined) {
        Debug::log("id3v2", "ID3v2Tag::parseHeader: undefined flags 0x", std::hex,
                   static_cast<int>(undefined), std::dec, " for v2.",
                   static_cast<int>(header.major_version));
    }
    
    Debug::log("id3v2", "ID3v2Tag::parseHeader: version=2.", std::to_string(header.major_version),
               ".", static_cast<int>(header.minor_version), " flags=0x", std::hex,
               static_cast<int>(header.flags), std::dec, " size=", header.size);
    
    return header;
}

void ID3v2Tag::addWarning(ParseError code, const std::string& frame_id, size_t offset,
                          const std::string& message) {
    Debug::log("id3v2", "ID3v2Tag: warning [", errorName(code), "] ",
               frame_id.empty() ? std::string("tag") : frame_id, " @", offset, ": ", message);
    m_warnings.push_back(ParseWarning{code, frame_id, offset, message});
}

// ============================================================================
// Body and extended header
// ============================================================================

void ID3v2Tag::parseBody(const uint8_t* data, size_t size) {
    size_t frames_offset = 0;
    
    if (m_header.extendedHeader()) {
        try {
            frames_offset = parseExtendedHeader(data, size);
        } catch (const TagException& e) {
            addWarning(e.code(), "", TagConstants::ID3V2_HEADER_SIZE,
                       std::string("extended header unusable, no frames read: ") + e.what());
            return;
        }
    }
    
    parseFrames(data + frames_offset, size - frames_offset,
                TagConstants::ID3V2_HEADER_SIZE + frames_offset);
}

size_t ID3v2Tag::parseExtendedHeader(const uint8_t* data, size_t size) {
    const size_t offset = TagConstants::ID3V2_HEADER_SIZE;
    if (size < 4) {
        throw TagException(ParseError::TruncatedData, "no room for the extended header size");
    }
    
    ID3v2ExtendedHeader ext;
    
    if (m_header.major_version == 3) {
        // ID3v2.3: 4-byte plain size, excluding the size field itself
        uint32_t declared = ID3v2Utils::readBigEndian(data, 4);
        if (declared > size - 4) {
            throw TagException(ParseError::TruncatedData,
                               "extended header size " + std::to_string(declared) + " exceeds the tag body");
        }
        ext.size = declared + 4;
        
        if (declared < 6) {
            addWarning(ParseError::MalformedFrame, "", offset,
                       "v2.3 extended header too short (" + std::to_string(declared) + " bytes)");
        } else {
            ext.flags = static_cast<uint16_t>((data[4] << 8) | data[5]);
            ext.padding_size = ID3v2Utils::readBigEndian(data + 6, 4);
            if (ext.flags & 0x8000) {
                if (declared >= 10) {
                    ext.crc = ID3v2Utils::readBigEndian(data + 10, 4);
                } else {
                    addWarning(ParseError::MalformedFrame, "", offset,
                               "v2.3 extended header flags a CRC it has no room for");
                }
            }
        }
    } else {
        // ID3v2.4: synchsafe size including itself, then flag byte count and flags
        uint32_t declared = ID3v2Utils::decodeSynchsafeBytes(data);
        if (declared < 6 || declared > size) {
            throw TagException(ParseError::MalformedFrame,
                               "v2.4 extended header size " + std::to_string(declared) + " is out of range");
        }
        ext.size = declared;
        
        uint8_t flag_bytes = data[4];
        if (flag_bytes != 1) {
            addWarning(ParseError::MalformedFrame, "", offset,
                       "v2.4 extended header declares " + std::to_string(flag_bytes) + " flag bytes");
        }
        ext.flags = data[5];
        
        // Flag data follows in flag-bit order, each item prefixed by its length
        size_t pos = 5 + flag_bytes;
        bool ok = true;
        auto take = [&](uint8_t expected_length) -> const uint8_t* {
            if (!ok || pos >= declared || data[pos] != expected_length ||
                pos + 1 + expected_length > declared) {
                ok = false;
                return nullptr;
            }
            const uint8_t* item = data + pos + 1;
            pos += 1 + expected_length;
            return item;
        };
        
        if (ext.flags & 0x40) {
            ext.update = take(0) != nullptr;
        }
        if (ext.flags & 0x20) {
            const uint8_t* crc = take(5);
            if (crc && ID3v2Utils::isSynchsafe(crc, 5)) {
                ext.crc = ID3v2Utils::decodeSynchsafeWide(crc, 5);
            } else {
                ok = false;
            }
        }
        if (ext.flags & 0x10) {
            const uint8_t* restrictions = take(1);
            if (restrictions) {
                ext.restrictions = restrictions[0];
            }
        }
        if (!ok) {
            addWarning(ParseError::MalformedFrame, "", offset,
                       "v2.4 extended header flag data is malformed");
        }
    }
    
    Debug::log("id3v2", "ID3v2Tag::parseExtendedHeader: ", ext.size, " bytes, flags=0x",
               std::hex, ext.flags, std::dec, ext.crc ? ", CRC present" : "");
    
    m_extended_header = ext;
    return ext.size;
}

// ============================================================================
// Frame ID normalization
// ============================================================================

std::string ID3v2Tag::normalizeFrameId(const std::string& id, uint8_t version) {
    if (version >= 3) {
        // Already 4-character format
        return id;
    }
    
    static const std::map<std::string, std::string> v22_to_v23_map = {
        // Text frames
        {"TT1", "TIT1"}, {"TT2", "TIT2"}, {"TT3", "TIT3"},
        {"TP1", "TPE1"}, {"TP2", "TPE2"}, {"TP3", "TPE3"}, {"TP4", "TPE4"},
        {"TCM", "TCOM"}, {"TXT", "TEXT"}, {"TLA", "TLAN"}, {"TCO", "TCON"},
        {"TAL", "TALB"}, {"TPA", "TPOS"}, {"TRK", "TRCK"}, {"TRC", "TSRC"},
        {"TYE", "TYER"}, {"TDA", "TDAT"}, {"TIM", "TIME"}, {"TRD", "TRDA"},
        {"TMT", "TMED"}, {"TFT", "TFLT"}, {"TBP", "TBPM"}, {"TCR", "TCOP"},
        {"TPB", "TPUB"}, {"TEN", "TENC"}, {"TSS", "TSSE"}, {"TOF", "TOFN"},
        {"TLE", "TLEN"}, {"TSI", "TSIZ"}, {"TDY", "TDLY"}, {"TKE", "TKEY"},
        {"TOT", "TOAL"}, {"TOA", "TOPE"}, {"TOL", "TOLY"}, {"TOR", "TORY"},
        {"TXX", "TXXX"},
        
        // URL frames
        {"WAF", "WOAF"}, {"WAR", "WOAR"}, {"WAS", "WOAS"}, {"WCM", "WCOM"},
        {"WCP", "WCOP"}, {"WPB", "WPUB"}, {"WXX", "WXXX"},
        
        // Comments, lyrics and pictures
        {"COM", "COMM"}, {"ULT", "USLT"}, {"PIC", "APIC"},
        
        // Other frames
        {"CNT", "PCNT"}, {"POP", "POPM"}, {"BUF", "RBUF"}, {"CRA", "AENC"},
        {"CRM", "COMR"}, {"ETC", "ETCO"}, {"EQU", "EQUA"}, {"IPL", "IPLS"},
        {"LNK", "LINK"}, {"MCI", "MCDI"}, {"MLL", "MLLT"}, {"REV", "RVRB"},
        {"RVA", "RVAD"}, {"SLT", "SYLT"}, {"STC", "SYTC"}, {"UFI", "UFID"},
        {"GEO", "GEOB"},
    };
    
    auto it = v22_to_v23_map.find(id);
    if (it != v22_to_v23_map.end()) {
        return it->second;
    }
    
    Debug::log("id3v2", "ID3v2Tag::normalizeFrameId: unknown v2.2 frame ID: ", id);
    return id;
}

// ============================================================================
// Frame loop
// ============================================================================

void ID3v2Tag::parseFrames(const uint8_t* data, size_t size, size_t base_offset) {
    const ID3v2FrameLayout& layout = ID3v2FrameLayout::forVersion(m_header.major_version);
    const size_t header_size = layout.headerSize();
    size_t pos = 0;
    
    while (pos + header_size <= size) {
        const uint8_t* frame_header = data + pos;
        
        // A zero byte where an identifier should start is padding
        if (frame_header[0] == 0) {
            m_padding_size = size - pos;
            Debug::log("id3v2", "ID3v2Tag::parseFrames: ", m_padding_size, " bytes of padding at ",
                       base_offset + pos);
            return;
        }
        
        if (m_frames.size() >= TagConstants::MAX_FRAME_COUNT) {
            addWarning(ParseError::MalformedFrame, "", base_offset + pos,
                       "frame limit of " + std::to_string(TagConstants::MAX_FRAME_COUNT) + " reached");
            return;
        }
        
        if (!layout.hasValidId(frame_header)) {
            addWarning(ParseError::MalformedFrame, "", base_offset + pos, "invalid frame identifier");
            pos = resync(data, size, pos + 1, layout);
            continue;
        }
        
        std::string id = layout.readId(frame_header);
        uint32_t frame_size = 0;
        if (!readFrameSize(data, size, pos, base_offset, layout, frame_size)) {
            pos = resync(data, size, pos + 1, layout);
            continue;
        }
        
        if (frame_size == 0) {
            addWarning(ParseError::MalformedFrame, id, base_offset + pos, "zero-size frame skipped");
            pos += header_size;
            continue;
        }
        
        ID3v2Frame frame;
        frame.original_id = id;
        frame.id = normalizeFrameId(id, m_header.major_version);
        frame.declared_size = frame_size;
        frame.flags = layout.readFlags(frame_header);
        frame.offset = base_offset + pos;
        
        processFrame(frame, frame_header + header_size, frame_size, layout);
        
        Debug::log("frame", "ID3v2Tag::parseFrames: ", frame.id, " (", id, ") @", frame.offset,
                   " size=", frame_size, " flags=0x", std::hex, frame.flags, std::dec);
        
        m_frames.push_back(std::move(frame));
        pos += header_size + frame_size;
    }
    
    if (pos < size) {
        Debug::log("id3v2", "ID3v2Tag::parseFrames: ", size - pos, " trailing bytes after last frame");
    }
}

bool ID3v2Tag::readFrameSize(const uint8_t* data, size_t size, size_t pos, size_t base_offset,
                             const ID3v2FrameLayout& layout, uint32_t& frame_size) {
    const uint8_t* frame_header = data + pos;
    const size_t remaining = size - pos - layout.headerSize();
    const std::string id = layout.readId(frame_header);
    
    if (layout.synchsafeSizes()) {
        uint32_t plain = layout.readPlainSize(frame_header);
        
        if (!ID3v2Utils::isSynchsafe(frame_header + layout.idLength())) {
            addWarning(ParseError::InvalidSynchsafe, id, base_offset + pos,
                       "frame size is not synchsafe, reading it as a plain integer");
            if (plain > remaining) {
                addWarning(ParseError::TruncatedData, id, base_offset + pos,
                           "plain frame size " + std::to_string(plain) + " exceeds the " +
                           std::to_string(remaining) + " bytes left");
                return false;
            }
            frame_size = plain;
            return true;
        }
        
        frame_size = layout.readSize(frame_header);
        
        // iTunes wrote plain sizes into v2.4 tags; below 0x80 both readings agree
        if (frame_size >= 0x80) {
            size_t header_end = pos + layout.headerSize();
            bool synchsafe_fits = frame_size <= remaining &&
                                  isFrameBoundary(data, size, header_end + frame_size, layout);
            bool plain_fits = plain <= remaining &&
                              isFrameBoundary(data, size, header_end + plain, layout);
            if (!synchsafe_fits && plain_fits) {
                Debug::log("id3v2", "ID3v2Tag::readFrameSize: ", id, " size read as plain ",
                           plain, " instead of synchsafe ", frame_size);
                frame_size = plain;
            }
        }
    } else {
        frame_size = layout.readSize(frame_header);
    }
    
    if (frame_size > remaining) {
        addWarning(ParseError::TruncatedData, id, base_offset + pos,
                   "frame size " + std::to_string(frame_size) + " exceeds the " +
                   std::to_string(remaining) + " bytes left");
        return false;
    }
    
    if (frame_size > TagConstants::MAX_FRAME_SIZE) {
        addWarning(ParseError::MalformedFrame, id, base_offset + pos,
                   "frame size " + std::to_string(frame_size) + " exceeds the frame limit");
        return false;
    }
    
    return true;
}

bool ID3v2Tag::isFrameBoundary(const uint8_t* data, size_t size, size_t end,
                               const ID3v2FrameLayout& layout) {
    if (end == size) {
        return true;
    }
    if (end > size) {
        return false;
    }
    if (data[end] == 0) {
        return true;
    }
    return end + layout.headerSize() <= size && layout.hasValidId(data + end);
}

size_t ID3v2Tag::resync(const uint8_t* data, size_t size, size_t from,
                        const ID3v2FrameLayout& layout) {
    const size_t header_size = layout.headerSize();
    
    for (size_t pos = from; pos + header_size <= size; ++pos) {
        const uint8_t* candidate = data + pos;
        if (!layout.hasValidId(candidate)) {
            continue;
        }
        
        uint32_t candidate_size;
        if (layout.synchsafeSizes() && ID3v2Utils::isSynchsafe(candidate + layout.idLength())) {
            candidate_size = layout.readSize(candidate);
        } else {
            candidate_size = layout.readPlainSize(candidate);
        }
        
        if (candidate_size > 0 && candidate_size <= size - pos - header_size) {
            Debug::log("id3v2", "ID3v2Tag::resync: skipped ", pos - from + 1,
                       " bytes to a possible ", layout.readId(candidate), " frame");
            return pos;
        }
    }
    
    Debug::log("id3v2", "ID3v2Tag::resync: no further frames");
    return size;
}

// ============================================================================
// Frame flag processing
// ============================================================================

void ID3v2Tag::processFrame(ID3v2Frame& frame, const uint8_t* payload, size_t size,
                            const ID3v2FrameLayout& layout) {
    ID3v2FrameFlags flags = layout.decodeFlags(frame.flags);
    const uint8_t* p = payload;
    size_t remaining = size;
    uint32_t data_length = 0;
    
    frame.compressed = flags.compression;
    frame.encrypted = flags.encryption;
    
    try {
        auto need = [&](size_t count, const char* what) {
            if (remaining < count) {
                throw TagException(ParseError::MalformedFrame,
                                   std::string("frame too short for its ") + what);
            }
        };
        
        // Flag data sits in front of the payload, in a per-revision order
        if (layout.version() == 3) {
            if (flags.compression) {
                need(4, "decompressed size");
                data_length = ID3v2Utils::readBigEndian(p, 4);
                p += 4;
                remaining -= 4;
            }
            if (flags.encryption) {
                need(1, "encryption method");
                p++;
                remaining--;
            }
            if (flags.grouping) {
                need(1, "group id");
                frame.group_id = *p;
                p++;
                remaining--;
            }
        } else if (layout.version() == 4) {
            if (flags.grouping) {
                need(1, "group id");
                frame.group_id = *p;
                p++;
                remaining--;
            }
            if (flags.encryption) {
                need(1, "encryption method");
                p++;
                remaining--;
            }
            if (flags.data_length_indicator) {
                need(4, "data length indicator");
                data_length = ID3v2Utils::decodeSynchsafeBytes(p);
                p += 4;
                remaining -= 4;
            }
        }
    } catch (const TagException& e) {
        frame.opaque = true;
        frame.opaque_reason = e.what();
        frame.data.assign(payload, payload + size);
        addWarning(e.code(), frame.id, frame.offset, e.what());
        return;
    }
    
    std::vector<uint8_t> body(p, p + remaining);
    
    if (layout.version() == 4 && (flags.unsynchronisation || m_header.unsynchronisation())) {
        body = ID3v2Utils::decodeUnsync(body.data(), body.size());
    }
    
    if (flags.encryption) {
        frame.opaque = true;
        frame.opaque_reason = "frame is encrypted";
        addWarning(ParseError::MalformedFrame, frame.id, frame.offset,
                   "encrypted frame kept as raw bytes");
        frame.data = std::move(body);
        return;
    }
    
    if (flags.compression) {
        try {
            ZlibDecompressor inflater(TagConstants::MAX_DECOMPRESSED_SIZE);
            std::vector<uint8_t> inflated = inflater.decompress(body.data(), body.size(), data_length);
            Debug::log("frame", "ID3v2Tag::processFrame: ", frame.id, " inflated ", body.size(),
                       " -> ", inflated.size(), " bytes");
            body = std::move(inflated);
        } catch (const TagException& e) {
            frame.opaque = true;
            frame.opaque_reason = std::string("decompression failed: ") + e.what();
            addWarning(ParseError::MalformedFrame, frame.id, frame.offset, frame.opaque_reason);
        }
    }
    
    frame.data = std::move(body);
}

void ID3v2Tag::checkFooter(const uint8_t* data, size_t size) {
    size_t footer_offset = TagConstants::ID3V2_HEADER_SIZE + m_header.size;
    if (footer_offset > size || size - footer_offset < TagConstants::ID3V2_FOOTER_SIZE) {
        addWarning(ParseError::TruncatedData, "", footer_offset, "footer flagged but missing");
        return;
    }
    if (std::memcmp(data + footer_offset, "3DI", 3) != 0) {
        addWarning(ParseError::MalformedFrame, "", footer_offset, "footer does not start with 3DI");
    }
}

// ============================================================================
// Frame decoding
// ============================================================================

void ID3v2Tag::decodeFrames() {
    m_decoded_frames.reserve(m_frames.size());
    
    for (const ID3v2Frame& frame : m_frames) {
        if (frame.opaque) {
            m_decoded_frames.push_back(RawFrame{frame.id, frame.data, ParseError::MalformedFrame,
                                                frame.opaque_reason});
            continue;
        }
        
        DecodedFrame decoded = ID3v2FrameDecoder::decode(frame, m_header.major_version);
        
        if (const RawFrame* raw = std::get_if<RawFrame>(&decoded)) {
            if (raw->error) {
                addWarning(*raw->error, frame.id, frame.offset, raw->reason);
            }
        } else if (const PictureFrame* picture = std::get_if<PictureFrame>(&decoded)) {
            m_pictures.push_back(picture->picture);
        }
        
        m_decoded_frames.push_back(std::move(decoded));
    }
}

// ============================================================================
// Tag interface implementation
// ============================================================================

std::optional<std::string> ID3v2Tag::getTextField(const std::string& frame_id) const {
    for (const DecodedFrame& decoded : m_decoded_frames) {
        const TextFrame* text = std::get_if<TextFrame>(&decoded);
        if (text && text->id == frame_id) {
            std::string value = text->first();
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ID3v2Tag::getCommentField() const {
    const CommentFrame* first = nullptr;
    
    for (const DecodedFrame& decoded : m_decoded_frames) {
        const CommentFrame* comment = std::get_if<CommentFrame>(&decoded);
        if (!comment || comment->kind != FrameKind::Comment) {
            continue;
        }
        if (comment->description.empty()) {
            first = comment;
            break;
        }
        if (!first) {
            first = comment;
        }
    }
    
    if (!first || first->text.empty()) {
        return std::nullopt;
    }
    return first->text;
}

std::optional<std::string> ID3v2Tag::getField(CommonField field) const {
    switch (field) {
        case CommonField::Title:       return getTextField("TIT2");
        case CommonField::Artist:      return getTextField("TPE1");
        case CommonField::Album:       return getTextField("TALB");
        case CommonField::Track:       return getTextField("TRCK");
        case CommonField::AlbumArtist: return getTextField("TPE2");
        case CommonField::Composer:    return getTextField("TCOM");
        case CommonField::Comment:     return getCommentField();
        
        case CommonField::Year: {
            // TDRC (v2.4 recording time) first, then TYER (v2.3 year)
            std::optional<std::string> date = getTextField("TDRC");
            if (!date) {
                date = getTextField("TYER");
            }
            if (!date) {
                return std::nullopt;
            }
            return date->substr(0, 4);
        }
        
        case CommonField::Genre: {
            std::optional<std::string> genre = getTextField("TCON");
            if (!genre) {
                return std::nullopt;
            }
            std::string resolved = resolveGenre(*genre);
            if (resolved.empty()) {
                return std::nullopt;
            }
            return resolved;
        }
    }
    return std::nullopt;
}

std::string ID3v2Tag::resolveGenre(const std::string& value) {
    auto isNumber = [](const std::string& s) {
        if (s.empty() || s.size() > 3) {
            return false;
        }
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    };
    
    // v2.4 style: a bare genre number
    if (isNumber(value)) {
        unsigned long index = std::stoul(value);
        if (index <= 255) {
            return ID3v1Tag::genreFromIndex(static_cast<uint8_t>(index));
        }
        return value;
    }
    
    // v2.3 style: "(N)" references, optionally followed by a refinement
    std::string first_reference;
    size_t pos = 0;
    while (pos < value.size() && value[pos] == '(') {
        if (pos + 1 < value.size() && value[pos + 1] == '(') {
            // "((" escapes a refinement that starts with '('
            pos++;
            break;
        }
        size_t close = value.find(')', pos);
        if (close == std::string::npos) {
            break;
        }
        
        std::string token = value.substr(pos + 1, close - pos - 1);
        std::string name;
        if (isNumber(token)) {
            unsigned long index = std::stoul(token);
            name = index <= 255 ? ID3v1Tag::genreFromIndex(static_cast<uint8_t>(index)) : token;
        } else if (token == "RX") {
            name = "Remix";
        } else if (token == "CR") {
            name = "Cover";
        } else {
            break;
        }
        
        if (first_reference.empty()) {
            first_reference = name;
        }
        pos = close + 1;
    }
    
    if (pos == 0) {
        return value;
    }
    
    std::string refinement = value.substr(pos);
    if (!refinement.empty()) {
        return refinement;
    }
    return first_reference;
}

std::vector<CommentEntry> ID3v2Tag::comments() const {
    std::vector<CommentEntry> result;
    for (const DecodedFrame& decoded : m_decoded_frames) {
        const CommentFrame* comment = std::get_if<CommentFrame>(&decoded);
        if (comment && comment->kind == FrameKind::Comment) {
            result.push_back(comment->toEntry());
        }
    }
    return result;
}

std::vector<CommentEntry> ID3v2Tag::lyrics() const {
    std::vector<CommentEntry> result;
    for (const DecodedFrame& decoded : m_decoded_frames) {
        const CommentFrame* comment = std::get_if<CommentFrame>(&decoded);
        if (comment && comment->kind == FrameKind::Lyrics) {
            result.push_back(comment->toEntry());
        }
    }
    return result;
}

std::string ID3v2Tag::formatName() const {
    return "ID3v2." + std::to_string(m_header.major_version);
}

// ============================================================================
// ID3v2-specific methods
// ============================================================================

std::vector<ID3v2Frame> ID3v2Tag::getFrames(const std::string& frame_id) const {
    std::vector<ID3v2Frame> result;
    for (const ID3v2Frame& frame : m_frames) {
        if (frame.id == frame_id) {
            result.push_back(frame);
        }
    }
    return result;
}

const ID3v2Frame* ID3v2Tag::getFrame(const std::string& frame_id) const {
    for (const ID3v2Frame& frame : m_frames) {
        if (frame.id == frame_id) {
            return &frame;
        }
    }
    return nullptr;
}

std::vector<std::string> ID3v2Tag::getFrameIds() const {
    std::vector<std::string> ids;
    for (const ID3v2Frame& frame : m_frames) {
        if (std::find(ids.begin(), ids.end(), frame.id) == ids.end()) {
            ids.push_back(frame.id);
        }
    }
    return ids;
}

std::vector<std::string> ID3v2Tag::getTextValues(const std::string& frame_id) const {
    std::vector<std::string> values;
    for (const DecodedFrame& decoded : m_decoded_frames) {
        const TextFrame* text = std::get_if<TextFrame>(&decoded);
        if (text && text->id == frame_id) {
            values.insert(values.end(), text->values.begin(), text->values.end());
        }
    }
    return values;
}

} // namespace Tag
} // namespace ID3Peek
