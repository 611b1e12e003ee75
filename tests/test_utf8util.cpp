/*
 * test_utf8util.cpp - Unit tests for UTF8Util
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include "test_framework.h"

using ID3Peek::Core::Utility::UTF8Util;
using namespace TestFramework;

static void test_is_valid() {
    ASSERT_TRUE(UTF8Util::isValid(std::string("plain ascii")), "ASCII is valid");
    ASSERT_TRUE(UTF8Util::isValid(std::string("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80")), "2-, 3- and 4-byte forms");
    ASSERT_FALSE(UTF8Util::isValid(std::string("\xC0\xAF")), "overlong '/' rejected");
    ASSERT_FALSE(UTF8Util::isValid(std::string("\xED\xA0\x80")), "encoded surrogate rejected");
    ASSERT_FALSE(UTF8Util::isValid(std::string("\xE2\x82")), "truncated sequence rejected");
    ASSERT_TRUE(UTF8Util::isValid(UTF8Util::replacementCharacter()), "U+FFFD itself is valid");
}

static void test_repair() {
    ASSERT_EQUALS(std::string("a\xEF\xBF\xBD" "b"), UTF8Util::repair(std::string("a\x80" "b")),
                  "stray continuation byte replaced");
    ASSERT_EQUALS(std::string("\xC3\xA9"), UTF8Util::repair(std::string("\xC3\xA9")),
                  "valid text unchanged");
}

static void test_decode_safe_stops_at_nul() {
    const uint8_t data[] = {'a', 'b', 0x00, 'c'};
    ASSERT_EQUALS(std::string("ab"), UTF8Util::decodeSafe(data, sizeof(data)), "NUL ends the text");
}

static void test_latin1() {
    const uint8_t data[] = {0x41, 0xA9, 0xFF};
    ASSERT_EQUALS(std::string("A\xC2\xA9\xC3\xBF"), UTF8Util::fromLatin1(data, sizeof(data)),
                  "high Latin-1 bytes become 2-byte sequences");
}

static void test_utf16_bom() {
    const uint8_t le[] = {0xFF, 0xFE, 0xAC, 0x20};
    ASSERT_EQUALS(std::string("\xE2\x82\xAC"), UTF8Util::fromUTF16BOM(le, sizeof(le)), "euro sign LE");
    const uint8_t none[] = {0x20, 0xAC};
    ASSERT_EQUALS(std::string("\xE2\x82\xAC"), UTF8Util::fromUTF16BOM(none, sizeof(none)),
                  "no BOM reads big endian");
}

static void test_codepoints() {
    size_t consumed = 0;
    const uint8_t euro[] = {0xE2, 0x82, 0xAC};
    ASSERT_EQUALS(0x20ACu, UTF8Util::decodeCodepoint(euro, sizeof(euro), consumed), "euro code point");
    ASSERT_EQUALS(3u, consumed, "three bytes consumed");
    
    ASSERT_EQUALS(std::string("\xF0\x9F\x98\x80"), UTF8Util::encodeCodepoint(0x1F600), "4-byte encode");
    ASSERT_EQUALS(UTF8Util::replacementCharacter(), UTF8Util::encodeCodepoint(0xD800),
                  "surrogate encodes as U+FFFD");
    ASSERT_FALSE(UTF8Util::isValidCodepoint(0x110000), "beyond U+10FFFF");
}

static void test_find_null_terminator() {
    const uint8_t wide[] = {0x41, 0x00, 0x00, 0x42, 0x00, 0x00};
    ASSERT_EQUALS(4u, UTF8Util::findNullTerminator(wide, sizeof(wide), 2), "aligned 2-byte NUL");
    ASSERT_EQUALS(1u, UTF8Util::findNullTerminator(wide, sizeof(wide), 1), "single-byte NUL");
    const uint8_t none[] = {'x', 'y'};
    ASSERT_EQUALS(2u, UTF8Util::findNullTerminator(none, sizeof(none), 1), "size when absent");
}

int main() {
    TestSuite suite("UTF8Util Unit Tests");
    
    suite.addTest("UTF8Util_IsValid", test_is_valid);
    suite.addTest("UTF8Util_Repair", test_repair);
    suite.addTest("UTF8Util_DecodeSafe", test_decode_safe_stops_at_nul);
    suite.addTest("UTF8Util_Latin1", test_latin1);
    suite.addTest("UTF8Util_UTF16BOM", test_utf16_bom);
    suite.addTest("UTF8Util_Codepoints", test_codepoints);
    suite.addTest("UTF8Util_FindNullTerminator", test_find_null_terminator);
    
    auto results = suite.runAll();
    suite.printResults(results);
    
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
