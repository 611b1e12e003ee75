/*
 * Tag.cpp - Format-neutral metadata tag interface
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include <cctype>

namespace ID3Peek {
namespace Tag {

const char* fieldName(CommonField field) {
    switch (field) {
        case CommonField::Title:       return "Title";
        case CommonField::Artist:      return "Artist";
        case CommonField::Album:       return "Album";
        case CommonField::Track:       return "Track";
        case CommonField::Year:        return "Year";
        case CommonField::Genre:       return "Genre";
        case CommonField::Comment:     return "Comment";
        case CommonField::AlbumArtist: return "Album artist";
        case CommonField::Composer:    return "Composer";
    }
    return "Unknown";
}

const std::vector<CommonField>& allCommonFields() {
    static const std::vector<CommonField> fields = {
        CommonField::Title,
        CommonField::Artist,
        CommonField::Album,
        CommonField::AlbumArtist,
        CommonField::Composer,
        CommonField::Track,
        CommonField::Year,
        CommonField::Genre,
        CommonField::Comment
    };
    return fields;
}

// ============================================================================
// Picture types
// ============================================================================

static const char* const s_picture_type_names[PICTURE_TYPE_COUNT] = {
    "Other",
    "File icon",
    "Other file icon",
    "Front cover",
    "Back cover",
    "Leaflet page",
    "Media",
    "Lead artist",
    "Artist",
    "Conductor",
    "Band",
    "Composer",
    "Lyricist",
    "Recording location",
    "During recording",
    "During performance",
    "Movie screen capture",
    "Bright colored fish",
    "Illustration",
    "Band logotype",
    "Publisher logotype"
};

const char* pictureTypeName(PictureType type) {
    uint8_t index = static_cast<uint8_t>(type);
    if (index >= PICTURE_TYPE_COUNT) {
        return "Unknown";
    }
    return s_picture_type_names[index];
}

// Lowercase and drop separators so "Front-Cover" matches "front cover"
static std::string foldPictureTypeName(const std::string& text) {
    std::string folded;
    for (char c : text) {
        if (c == ' ' || c == '-' || c == '_') {
            continue;
        }
        folded += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return folded;
}

std::optional<PictureType> pictureTypeFromString(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    if (std::all_of(text.begin(), text.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        if (text.size() > 3) {
            return std::nullopt;
        }
        int value = std::stoi(text);
        if (value >= PICTURE_TYPE_COUNT) {
            return std::nullopt;
        }
        return static_cast<PictureType>(value);
    }

    std::string wanted = foldPictureTypeName(text);
    for (uint8_t i = 0; i < PICTURE_TYPE_COUNT; ++i) {
        if (foldPictureTypeName(s_picture_type_names[i]) == wanted) {
            return static_cast<PictureType>(i);
        }
    }
    // Short aliases
    if (wanted == "front" || wanted == "cover") {
        return PictureType::FrontCover;
    }
    if (wanted == "back") {
        return PictureType::BackCover;
    }
    return std::nullopt;
}

// ============================================================================
// Tag helpers
// ============================================================================

std::map<std::string, std::string> Tag::getAllFields() const {
    std::map<std::string, std::string> result;
    for (CommonField field : allCommonFields()) {
        auto value = getField(field);
        if (value) {
            result[fieldName(field)] = *value;
        }
    }
    return result;
}

const Picture* Tag::findPicture(PictureType type) const {
    for (const auto& picture : pictures()) {
        if (picture.type == type) {
            return &picture;
        }
    }
    return nullptr;
}

const Picture* Tag::frontCover() const {
    const Picture* cover = findPicture(PictureType::FrontCover);
    if (cover) {
        return cover;
    }
    const auto& all = pictures();
    return all.empty() ? nullptr : &all.front();
}

bool Tag::isEmpty() const {
    for (CommonField field : allCommonFields()) {
        if (getField(field)) {
            return false;
        }
    }
    return comments().empty() && lyrics().empty() && pictures().empty();
}

} // namespace Tag
} // namespace ID3Peek
