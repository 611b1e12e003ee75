/*
 * ID3v1Tag.cpp - ID3v1/ID3v1.1 tag reader
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"

using ID3Peek::Core::Utility::UTF8Util;

namespace ID3Peek {
namespace Tag {

// Field offsets within the 128-byte tag
namespace {
constexpr size_t TITLE_OFFSET = 3;
constexpr size_t ARTIST_OFFSET = 33;
constexpr size_t ALBUM_OFFSET = 63;
constexpr size_t YEAR_OFFSET = 93;
constexpr size_t COMMENT_OFFSET = 97;
constexpr size_t GENRE_OFFSET = 127;
constexpr size_t TEXT_FIELD_WIDTH = 30;
constexpr size_t YEAR_WIDTH = 4;
}

// ============================================================================
// ID3v1 Genre List (Standard 80 + Winamp Extensions up to 191)
// ============================================================================

static const char* const s_genre_list[ID3v1Tag::GENRE_COUNT] = {
    /*   0 */ "Blues", "Classic Rock", "Country", "Dance",
    /*   4 */ "Disco", "Funk", "Grunge", "Hip-Hop",
    /*   8 */ "Jazz", "Metal", "New Age", "Oldies",
    /*  12 */ "Other", "Pop", "R&B", "Rap",
    /*  16 */ "Reggae", "Rock", "Techno", "Industrial",
    /*  20 */ "Alternative", "Ska", "Death Metal", "Pranks",
    /*  24 */ "Soundtrack", "Euro-Techno", "Ambient", "Trip-Hop",
    /*  28 */ "Vocal", "Jazz+Funk", "Fusion", "Trance",
    /*  32 */ "Classical", "Instrumental", "Acid", "House",
    /*  36 */ "Game", "Sound Clip", "Gospel", "Noise",
    /*  40 */ "AlternRock", "Bass", "Soul", "Punk",
    /*  44 */ "Space", "Meditative", "Instrumental Pop", "Instrumental Rock",
    /*  48 */ "Ethnic", "Gothic", "Darkwave", "Techno-Industrial",
    /*  52 */ "Electronic", "Pop-Folk", "Eurodance", "Dream",
    /*  56 */ "Southern Rock", "Comedy", "Cult", "Gangsta",
    /*  60 */ "Top 40", "Christian Rap", "Pop/Funk", "Jungle",
    /*  64 */ "Native American", "Cabaret", "New Wave", "Psychedelic",
    /*  68 */ "Rave", "Showtunes", "Trailer", "Lo-Fi",
    /*  72 */ "Tribal", "Acid Punk", "Acid Jazz", "Polka",
    /*  76 */ "Retro", "Musical", "Rock & Roll", "Hard Rock",
    /*  80 */ "Folk", "Folk-Rock", "National Folk", "Swing",
    /*  84 */ "Fast Fusion", "Bebop", "Latin", "Revival",
    /*  88 */ "Celtic", "Bluegrass", "Avantgarde", "Gothic Rock",
    /*  92 */ "Progressive Rock", "Psychedelic Rock", "Symphonic Rock", "Slow Rock",
    /*  96 */ "Big Band", "Chorus", "Easy Listening", "Acoustic",
    /* 100 */ "Humour", "Speech", "Chanson", "Opera",
    /* 104 */ "Chamber Music", "Sonata", "Symphony", "Booty Bass",
    /* 108 */ "Primus", "Porn Groove", "Satire", "Slow Jam",
    /* 112 */ "Club", "Tango", "Samba", "Folklore",
    /* 116 */ "Ballad", "Power Ballad", "Rhythmic Soul", "Freestyle",
    /* 120 */ "Duet", "Punk Rock", "Drum Solo", "A Cappella",
    /* 124 */ "Euro-House", "Dance Hall", "Goa", "Drum & Bass",
    /* 128 */ "Club-House", "Hardcore Techno", "Terror", "Indie",
    /* 132 */ "BritPop", "Negerpunk", "Polsk Punk", "Beat",
    /* 136 */ "Christian Gangsta Rap", "Heavy Metal", "Black Metal", "Crossover",
    /* 140 */ "Contemporary Christian", "Christian Rock", "Merengue", "Salsa",
    /* 144 */ "Thrash Metal", "Anime", "JPop", "Synthpop",
    /* 148 */ "Abstract", "Art Rock", "Baroque", "Bhangra",
    /* 152 */ "Big Beat", "Breakbeat", "Chillout", "Downtempo",
    /* 156 */ "Dub", "EBM", "Eclectic", "Electro",
    /* 160 */ "Electroclash", "Emo", "Experimental", "Garage",
    /* 164 */ "Global", "IDM", "Illbient", "Industro-Goth",
    /* 168 */ "Jam Band", "Krautrock", "Leftfield", "Lounge",
    /* 172 */ "Math Rock", "New Romantic", "Nu-Breakz", "Post-Punk",
    /* 176 */ "Post-Rock", "Psytrance", "Shoegaze", "Space Rock",
    /* 180 */ "Trop Rock", "World Music", "Neoclassical", "Audiobook",
    /* 184 */ "Audio Theatre", "Neue Deutsche Welle", "Podcast", "Indie Rock",
    /* 188 */ "G-Funk", "Dubstep", "Garage Rock", "Psybient"
};

// ============================================================================
// Static Methods
// ============================================================================

std::string ID3v1Tag::genreFromIndex(uint8_t index) {
    if (index < GENRE_COUNT) {
        return s_genre_list[index];
    }
    return "Unknown";
}

bool ID3v1Tag::isValid(const uint8_t* data) {
    return data && data[0] == 'T' && data[1] == 'A' && data[2] == 'G';
}

std::string ID3v1Tag::readField(const uint8_t* data, size_t width) {
    size_t len = UTF8Util::findNullTerminator(data, width, 1);
    while (len > 0 && (data[len - 1] == ' ' || data[len - 1] == '\0')) {
        len--;
    }
    return UTF8Util::fromLatin1(data, len);
}

std::unique_ptr<ID3v1Tag> ID3v1Tag::parse(const uint8_t* data) {
    if (!isValid(data)) {
        Debug::log("id3v1", "ID3v1Tag::parse: no TAG marker");
        return nullptr;
    }
    
    auto tag = std::make_unique<ID3v1Tag>();
    
    tag->m_title = readField(data + TITLE_OFFSET, TEXT_FIELD_WIDTH);
    tag->m_artist = readField(data + ARTIST_OFFSET, TEXT_FIELD_WIDTH);
    tag->m_album = readField(data + ALBUM_OFFSET, TEXT_FIELD_WIDTH);
    tag->m_year = readField(data + YEAR_OFFSET, YEAR_WIDTH);
    
    // ID3v1.1: comment byte 28 is zero and byte 29 holds the track
    if (data[COMMENT_OFFSET + 28] == 0x00 && data[COMMENT_OFFSET + 29] != 0x00) {
        tag->m_is_v1_1 = true;
        tag->m_comment = readField(data + COMMENT_OFFSET, 28);
        tag->m_track = data[COMMENT_OFFSET + 29];
    } else {
        tag->m_comment = readField(data + COMMENT_OFFSET, TEXT_FIELD_WIDTH);
    }
    
    tag->m_genre_index = data[GENRE_OFFSET];
    
    Debug::log("id3v1", "ID3v1Tag::parse: ", tag->formatName(), " title='", tag->m_title,
               "', artist='", tag->m_artist, "', album='", tag->m_album,
               "', year='", tag->m_year, "', track=", static_cast<int>(tag->m_track),
               ", genre=", static_cast<int>(tag->m_genre_index));
    
    return tag;
}

// ============================================================================
// Tag Interface Implementation
// ============================================================================

std::optional<std::string> ID3v1Tag::getField(CommonField field) const {
    auto present = [](const std::string& value) -> std::optional<std::string> {
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    };
    
    switch (field) {
        case CommonField::Title:   return present(m_title);
        case CommonField::Artist:  return present(m_artist);
        case CommonField::Album:   return present(m_album);
        case CommonField::Year:    return present(m_year);
        case CommonField::Comment: return present(m_comment);
        case CommonField::Genre:   return genreFromIndex(m_genre_index);
        case CommonField::Track:
            if (m_is_v1_1) {
                return std::to_string(m_track);
            }
            return std::nullopt;
        case CommonField::AlbumArtist:
        case CommonField::Composer:
            return std::nullopt; // Not in ID3v1
    }
    return std::nullopt;
}

std::vector<CommentEntry> ID3v1Tag::comments() const {
    if (m_comment.empty()) {
        return {};
    }
    return {CommentEntry{"", "", m_comment}};
}

const std::vector<Picture>& ID3v1Tag::pictures() const {
    static const std::vector<Picture> none;
    return none;
}

std::string ID3v1Tag::formatName() const {
    return m_is_v1_1 ? "ID3v1.1" : "ID3v1";
}

} // namespace Tag
} // namespace ID3Peek
