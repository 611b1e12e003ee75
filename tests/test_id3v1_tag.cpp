/*
 * test_id3v1_tag.cpp - Unit tests for ID3v1Tag
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include "test_framework.h"

using namespace ID3Peek::Tag;
using namespace TestFramework;
using TagTestUtils::Bytes;

// ============================================================================
// Detection
// ============================================================================

class ID3v1Tag_Parse_NoMarker : public TestCase {
public:
    ID3v1Tag_Parse_NoMarker() : TestCase("ID3v1Tag_Parse_NoMarker") {}
protected:
    void runTest() override {
        Bytes data(128, 'x');
        ASSERT_NULL(ID3v1Tag::parse(data.data()), "buffer without TAG is not a tag");
        ASSERT_FALSE(ID3v1Tag::isValid(data.data()), "isValid agrees");
    }
};

class ID3v1Tag_Parse_TrimsFields : public TestCase {
public:
    ID3v1Tag_Parse_TrimsFields() : TestCase("ID3v1Tag_Parse_TrimsFields") {}
protected:
    void runTest() override {
        Bytes data = TagTestUtils::id3v1("Song Title", "Artist", "Album", "1999", "Nice", 0, 17);
        // Space padding as written by some taggers
        for (size_t i = 3 + 10; i < 33; ++i) {
            data[i] = ' ';
        }
        
        auto tag = ID3v1Tag::parse(data.data());
        ASSERT_NOT_NULL(tag.get(), "TAG marker recognised");
        ASSERT_EQUALS(std::string("Song Title"), tag->title().value_or(""), "title trimmed");
        ASSERT_EQUALS(std::string("Artist"), tag->artist().value_or(""), "artist");
        ASSERT_EQUALS(std::string("Album"), tag->album().value_or(""), "album");
        ASSERT_EQUALS(std::string("1999"), tag->year().value_or(""), "year");
        ASSERT_EQUALS(std::string("Nice"), tag->comment().value_or(""), "comment");
        ASSERT_EQUALS(std::string("Rock"), tag->genre().value_or(""), "genre 17");
        ASSERT_FALSE(tag->isID3v1_1(), "plain ID3v1");
        ASSERT_FALSE(tag->track().has_value(), "no track in ID3v1.0");
        ASSERT_EQUALS(std::string("ID3v1"), tag->formatName(), "format name");
    }
};

class ID3v1Tag_Parse_V11Track : public TestCase {
public:
    ID3v1Tag_Parse_V11Track() : TestCase("ID3v1Tag_Parse_V11Track") {}
protected:
    void runTest() override {
        Bytes data = TagTestUtils::id3v1("T", "A", "B", "2001", "Comment", 7, 13);
        auto tag = ID3v1Tag::parse(data.data());
        ASSERT_NOT_NULL(tag.get(), "parsed");
        ASSERT_TRUE(tag->isID3v1_1(), "track byte makes it ID3v1.1");
        ASSERT_EQUALS(7, static_cast<int>(tag->trackNumber()), "track number");
        ASSERT_EQUALS(std::string("7"), tag->track().value_or(""), "track field");
        ASSERT_EQUALS(std::string("Comment"), tag->comment().value_or(""), "comment stops at 28 bytes");
        ASSERT_EQUALS(std::string("ID3v1.1"), tag->formatName(), "format name");
    }
};

class ID3v1Tag_Parse_EmptyFieldsAbsent : public TestCase {
public:
    ID3v1Tag_Parse_EmptyFieldsAbsent() : TestCase("ID3v1Tag_Parse_EmptyFieldsAbsent") {}
protected:
    void runTest() override {
        Bytes data = TagTestUtils::id3v1("", "", "", "", "", 0, 255);
        auto tag = ID3v1Tag::parse(data.data());
        ASSERT_NOT_NULL(tag.get(), "parsed");
        ASSERT_FALSE(tag->title().has_value(), "empty title is absent");
        ASSERT_FALSE(tag->comment().has_value(), "empty comment is absent");
        ASSERT_TRUE(tag->comments().empty(), "no comment entries");
        ASSERT_FALSE(tag->albumArtist().has_value(), "ID3v1 has no album artist");
        ASSERT_TRUE(tag->pictures().empty(), "ID3v1 has no pictures");
    }
};

class ID3v1Tag_Parse_Latin1 : public TestCase {
public:
    ID3v1Tag_Parse_Latin1() : TestCase("ID3v1Tag_Parse_Latin1") {}
protected:
    void runTest() override {
        Bytes data = TagTestUtils::id3v1("Caf\xE9", "", "", "", "", 0, 0);
        auto tag = ID3v1Tag::parse(data.data());
        ASSERT_NOT_NULL(tag.get(), "parsed");
        ASSERT_EQUALS(std::string("Caf\xC3\xA9"), tag->title().value_or(""), "Latin-1 converted to UTF-8");
    }
};

// ============================================================================
// Genres
// ============================================================================

class ID3v1Tag_Genre_Table : public TestCase {
public:
    ID3v1Tag_Genre_Table() : TestCase("ID3v1Tag_Genre_Table") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(std::string("Blues"), ID3v1Tag::genreFromIndex(0), "first entry");
        ASSERT_EQUALS(std::string("Pop"), ID3v1Tag::genreFromIndex(13), "standard entry");
        ASSERT_EQUALS(std::string("Psybient"), ID3v1Tag::genreFromIndex(191), "last Winamp entry");
        ASSERT_EQUALS(std::string("Unknown"), ID3v1Tag::genreFromIndex(192), "past the table");
        ASSERT_EQUALS(std::string("Unknown"), ID3v1Tag::genreFromIndex(255), "255 means none");
    }
};

class ID3v1Tag_Genre_RawIndex : public TestCase {
public:
    ID3v1Tag_Genre_RawIndex() : TestCase("ID3v1Tag_Genre_RawIndex") {}
protected:
    void runTest() override {
        Bytes data = TagTestUtils::id3v1("T", "", "", "", "", 0, 200);
        auto tag = ID3v1Tag::parse(data.data());
        ASSERT_NOT_NULL(tag.get(), "parsed");
        ASSERT_EQUALS(200, static_cast<int>(tag->genreIndex()), "raw index kept");
        ASSERT_EQUALS(std::string("Unknown"), tag->genre().value_or(""), "out-of-table genre");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    TestSuite suite("ID3v1Tag Unit Tests");
    
    suite.addTest(std::make_unique<ID3v1Tag_Parse_NoMarker>());
    suite.addTest(std::make_unique<ID3v1Tag_Parse_TrimsFields>());
    suite.addTest(std::make_unique<ID3v1Tag_Parse_V11Track>());
    suite.addTest(std::make_unique<ID3v1Tag_Parse_EmptyFieldsAbsent>());
    suite.addTest(std::make_unique<ID3v1Tag_Parse_Latin1>());
    suite.addTest(std::make_unique<ID3v1Tag_Genre_Table>());
    suite.addTest(std::make_unique<ID3v1Tag_Genre_RawIndex>());
    
    auto results = suite.runAll();
    suite.printResults(results);
    
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
