/*
 * test_tag_reader.cpp - Unit tests for TagReader and TagAggregator
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include "test_framework.h"
#include <unistd.h>
#include <cstdlib>

using namespace ID3Peek;
using namespace ID3Peek::Tag;
using namespace TestFramework;
using namespace TestFramework::TagTestUtils;

// A fake MP3 body between the tags
static Bytes audioBytes(size_t size) {
    Bytes audio(size);
    for (size_t i = 0; i < size; ++i) {
        audio[i] = static_cast<uint8_t>(0xE0 | (i & 0x0F));
    }
    return audio;
}

static Metadata read(const Bytes& data) {
    return TagReader::parse(data.data(), data.size());
}

static ParseError readError(const Bytes& data) {
    try {
        read(data);
    } catch (const TagException& e) {
        return e.code();
    }
    throw AssertionFailure("TagReader::parse did not throw");
}

// ============================================================================
// Aggregation
// ============================================================================

static void test_v2_wins_over_v1() {
    Bytes v2 = id3v2(3, concat({frame(3, "TIT2", textPayload("Long Title From V2")),
                                frame(3, "TPE1", textPayload("V2 Artist"))}));
    Bytes v1 = id3v1("Short V1", "V1 Artist", "V1 Album", "1999", "v1 comment", 5, 17);
    Metadata metadata = read(concat({v2, audioBytes(512), v1}));
    
    ASSERT_EQUALS(std::string("Long Title From V2"), metadata.title().value_or(""), "v2 title");
    ASSERT_EQUALS(std::string("V2 Artist"), metadata.artist().value_or(""), "v2 artist");
    ASSERT_EQUALS(std::string("V1 Album"), metadata.album().value_or(""), "album from v1");
    ASSERT_EQUALS(std::string("1999"), metadata.year().value_or(""), "year from v1");
    ASSERT_EQUALS(std::string("5"), metadata.track().value_or(""), "track from v1.1");
    ASSERT_EQUALS(std::string("Rock"), metadata.genre().value_or(""), "genre from v1");
    ASSERT_EQUALS(std::string("ID3v2.3 + ID3v1.1"), metadata.formatName(), "both formats");
    ASSERT_TRUE(metadata.hasID3v1() && metadata.hasID3v2(), "both present");
}

static void test_empty_v2_field_falls_back() {
    Bytes v2 = id3v2(4, frame(4, "TALB", textPayload("")));
    Bytes v1 = id3v1("T", "A", "Album One", "", "", 0, 255);
    Metadata metadata = read(concat({v2, v1}));
    ASSERT_EQUALS(std::string("Album One"), metadata.album().value_or(""), "empty v2 value ignored");
    ASSERT_EQUALS(std::string("ID3v2.4 + ID3v1"), metadata.formatName(), "v1.0 name");
}

static void test_v1_only() {
    Bytes data = concat({audioBytes(1000), id3v1("Only", "One", "", "2001", "", 0, 13)});
    Metadata metadata = read(data);
    ASSERT_EQUALS(std::string("Only"), metadata.title().value_or(""), "title");
    ASSERT_EQUALS(std::string("Pop"), metadata.genre().value_or(""), "genre");
    ASSERT_FALSE(metadata.album().has_value(), "empty album absent");
    ASSERT_EQUALS(std::string("ID3v1"), metadata.formatName(), "format");
    ASSERT_TRUE(metadata.frames().empty(), "v1 has no frames");
    ASSERT_TRUE(metadata.pictures().empty(), "v1 has no pictures");
}

static void test_v2_only() {
    Bytes comm = concat({Bytes{0}, bytes("eng"), Bytes{0}, bytes("a comment")});
    Bytes uslt = concat({Bytes{0}, bytes("eng"), Bytes{0}, bytes("some words")});
    Bytes apic = concat({Bytes{0}, bytes("image/png"), Bytes{0, 3, 0}, bytes("\x89PNG\r\n\x1A\n"), Bytes{1, 2, 3}});
    Bytes frames = concat({frame(3, "TIT2", textPayload("Solo")), frame(3, "COMM", comm),
                           frame(3, "USLT", uslt), frame(3, "APIC", apic), frame(3, "TIT2", textPayload("dup"))});
    Metadata metadata = read(concat({id3v2(3, frames, 0, 32), audioBytes(200)}));
    
    ASSERT_EQUALS(std::string("ID3v2.3"), metadata.formatName(), "format");
    ASSERT_EQUALS(std::string("a comment"), metadata.comment().value_or(""), "comment");
    ASSERT_EQUALS(1u, metadata.lyrics().size(), "lyrics");
    ASSERT_EQUALS(1u, metadata.pictures().size(), "picture");
    ASSERT_NOT_NULL(metadata.frontCover(), "front cover");
    ASSERT_NOT_NULL(metadata.findPicture(PictureType::FrontCover), "find by type");
    ASSERT_NULL(metadata.findPicture(PictureType::BackCover), "absent type");
    ASSERT_NOT_NULL(metadata.picture(0), "picture by index");
    ASSERT_NULL(metadata.picture(1), "index out of range");
    ASSERT_EQUALS(5u, metadata.frames().size(), "all frames kept");
    
    std::vector<std::string> ids = metadata.frameIds();
    ASSERT_EQUALS(4u, ids.size(), "duplicate ids collapsed");
    
    std::map<std::string, std::string> fields = metadata.fields();
    ASSERT_EQUALS(2u, fields.size(), "title and comment");
    ASSERT_EQUALS(std::string("Solo"), fields["Title"], "field by name");
}

static void test_tag_without_readable_fields() {
    Bytes priv = concat({bytes("owner"), Bytes{0}, Bytes{1, 2, 3}});
    Metadata metadata = read(id3v2(4, frame(4, "PRIV", priv)));
    ASSERT_TRUE(metadata.hasID3v2(), "tag found");
    ASSERT_EQUALS(1u, metadata.frames().size(), "PRIV kept");
    ASSERT_TRUE(metadata.isEmpty(), "nothing readable");
    
    Metadata with_title = read(id3v2(4, frame(4, "TIT2", textPayload("x"))));
    ASSERT_FALSE(with_title.isEmpty(), "title present");
    
    Metadata v1_only = read(concat({audioBytes(200), id3v1("", "", "", "", "", 0, 255)}));
    ASSERT_TRUE(v1_only.isEmpty(), "blank ID3v1");
}

// ============================================================================
// Errors
// ============================================================================

static void test_input_too_short() {
    ASSERT_TRUE(readError(Bytes{'I', 'D', '3'}) == ParseError::InputTooShort, "3 bytes");
    ASSERT_TRUE(readError(Bytes{}) == ParseError::InputTooShort, "empty");
    TestPatterns::assertThrows<TagException>([]() { TagReader::parse(nullptr, 0); },
                                             "cannot hold a tag", "null input");
}

static void test_no_tag() {
    ASSERT_TRUE(readError(audioBytes(4096)) == ParseError::NoTag, "plain audio");
    ASSERT_TRUE(readError(audioBytes(20)) == ParseError::NoTag, "short audio");
}

static void test_container_error_without_v1() {
    Bytes bad = id3v2(5, frame(4, "TIT2", textPayload("x")));
    ASSERT_TRUE(readError(concat({bad, audioBytes(300)})) == ParseError::UnsupportedRevision,
                "error propagates");
    
    Bytes bad_size = id3v2(3, {});
    bad_size[7] = 0xFF;
    ASSERT_TRUE(readError(bad_size) == ParseError::InvalidSynchsafe, "bad tag size");
}

static void test_container_error_with_v1() {
    Bytes bad = id3v2(5, frame(4, "TIT2", textPayload("x")));
    Bytes v1 = id3v1("Fallback", "", "", "", "", 0, 0);
    Metadata metadata = read(concat({bad, audioBytes(300), v1}));
    
    ASSERT_EQUALS(std::string("Fallback"), metadata.title().value_or(""), "v1 used");
    ASSERT_FALSE(metadata.warnings().empty(), "warning recorded");
    ASSERT_TRUE(metadata.warnings()[0].code == ParseError::UnsupportedRevision, "first warning");
    ASSERT_FALSE(metadata.hasID3v2(), "no v2");
}

static void test_warnings_carried() {
    Bytes frames = concat({frame(3, "TIT2", Bytes{}), frame(3, "TPE1", textPayload("a"))});
    Metadata metadata = read(id3v2(3, frames));
    ASSERT_EQUALS(1u, metadata.warnings().size(), "zero-size warning carried");
    ASSERT_EQUALS(std::string("TIT2"), metadata.warnings()[0].frame_id, "frame id");
}

static void test_v1_inside_container_ignored() {
    // A TAG block inside the ID3v2 padding is not a trailer
    Bytes v1 = id3v1("Hidden", "", "", "", "", 0, 0);
    Bytes data = id3v2(3, concat({frame(3, "TIT2", textPayload("Real"))}), 0, 0);
    Bytes padding(200, 0);
    std::copy(v1.begin(), v1.end(), padding.end() - 128);
    Bytes size = synchsafe(static_cast<uint32_t>(data.size() - 10 + padding.size()));
    std::copy(size.begin(), size.end(), data.begin() + 6);
    data = concat({data, padding});
    
    Metadata metadata = read(data);
    ASSERT_EQUALS(std::string("Real"), metadata.title().value_or(""), "v2 title");
    ASSERT_FALSE(metadata.hasID3v1(), "TAG inside the container not used");
}

// ============================================================================
// File input
// ============================================================================

class FileReadTest : public TestCase {
public:
    FileReadTest() : TestCase("TagReader_FileIOHandler") {}
    
protected:
    void setUp() override {
        char path[] = "/tmp/id3peek_test_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw TestSetupFailure("cannot create a temporary file");
        }
        m_path = path;
        
        Bytes data = concat({id3v2(4, frame(4, "TIT2", textPayload("From Disk"))), audioBytes(2048),
                             id3v1("", "Disk Artist", "", "", "", 1, 0)});
        ssize_t written = write(fd, data.data(), data.size());
        close(fd);
        if (written != static_cast<ssize_t>(data.size())) {
            throw TestSetupFailure("short write to " + m_path);
        }
    }
    
    void tearDown() override {
        if (!m_path.empty()) {
            unlink(m_path.c_str());
        }
    }
    
    void runTest() override {
        IO::File::FileIOHandler file(m_path);
        Metadata metadata = TagReader::parse(file);
        ASSERT_EQUALS(std::string("From Disk"), metadata.title().value_or(""), "title from v2");
        ASSERT_EQUALS(std::string("Disk Artist"), metadata.artist().value_or(""), "artist from v1");
        ASSERT_EQUALS(std::string("1"), metadata.track().value_or(""), "track");
    }
    
private:
    std::string m_path;
};

static void test_missing_file() {
    TestPatterns::assertThrows<IOException>([]() {
        IO::File::FileIOHandler file("/nonexistent/id3peek/test.mp3");
    }, "", "opening a missing file throws IOException");
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    TestSuite suite("TagReader Unit Tests");
    
    suite.addTest("TagReader_V2WinsOverV1", test_v2_wins_over_v1);
    suite.addTest("TagReader_EmptyV2FieldFallsBack", test_empty_v2_field_falls_back);
    suite.addTest("TagReader_V1Only", test_v1_only);
    suite.addTest("TagReader_V2Only", test_v2_only);
    suite.addTest("TagReader_NoReadableFields", test_tag_without_readable_fields);
    suite.addTest("TagReader_InputTooShort", test_input_too_short);
    suite.addTest("TagReader_NoTag", test_no_tag);
    suite.addTest("TagReader_ContainerErrorWithoutV1", test_container_error_without_v1);
    suite.addTest("TagReader_ContainerErrorWithV1", test_container_error_with_v1);
    suite.addTest("TagReader_WarningsCarried", test_warnings_carried);
    suite.addTest("TagReader_V1InsideContainer", test_v1_inside_container_ignored);
    suite.addTest(std::make_unique<FileReadTest>());
    suite.addTest("TagReader_MissingFile", test_missing_file);
    
    auto results = suite.runAll();
    suite.printResults(results);
    
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
