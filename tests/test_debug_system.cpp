/*
 * test_debug_system.cpp - Tests for the channel-based debug log
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "id3peek.h"
#include "test_framework.h"
#include <unistd.h>

using namespace ID3Peek;
using namespace TestFramework;

/**
 * @brief Runs one scenario with the log redirected to a scratch file
 */
class LogFileTest : public TestCase {
public:
    LogFileTest(const std::string& name, std::vector<std::string> channels,
                std::function<void(const std::string&)> check)
        : TestCase(name), m_channels(std::move(channels)), m_check(std::move(check)) {}
    
protected:
    void setUp() override {
        char path[] = "/tmp/id3peek_log_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw TestSetupFailure("cannot create a temporary log file");
        }
        close(fd);
        m_path = path;
        Debug::init(m_path, m_channels);
    }
    
    void tearDown() override {
        Debug::shutdown();
        if (!m_path.empty()) {
            unlink(m_path.c_str());
        }
    }
    
    void runTest() override {
        m_check(m_path);
    }
    
private:
    std::vector<std::string> m_channels;
    std::function<void(const std::string&)> m_check;
    std::string m_path;
};

static std::string readLog(const std::string& path) {
    Debug::shutdown();  // flushes and closes the file
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void check_enabled_channel(const std::string& path) {
    Debug::log("id3v2", "frame count ", 3);
    Debug::log("id3v1", "should not appear");
    std::string log = readLog(path);
    ASSERT_TRUE(contains(log, "[id3v2]: frame count 3"), "enabled channel written");
    ASSERT_FALSE(contains(log, "should not appear"), "disabled channel filtered");
}

static void check_location_logging(const std::string& path) {
    DEBUG_LOG("tag", "with location");
    std::string log = readLog(path);
    ASSERT_TRUE(contains(log, "[tag] check_location_logging:"), "function name recorded");
    ASSERT_TRUE(contains(log, "with location"), "message recorded");
}

static void check_all_channel(const std::string& path) {
    Debug::log("frame", "frame line");
    Debug::log("cli", "cli line");
    std::string log = readLog(path);
    ASSERT_TRUE(contains(log, "frame line") && contains(log, "cli line"), "all enables everything");
}

static void check_lazy_logging(const std::string& path) {
    int evaluated = 0;
    auto expensive = [&evaluated]() {
        evaluated++;
        return std::string("costly");
    };
    DEBUG_LOG_LAZY("io", "value: ", expensive());
    DEBUG_LOG_LAZY("tag", "value: ", expensive());
    std::string log = readLog(path);
    ASSERT_EQUALS(1, evaluated, "arguments of a disabled channel are not evaluated");
    ASSERT_TRUE(contains(log, "[tag]: value: costly"), "enabled lazy line written");
}

static void check_parser_logs(const std::string& path) {
    std::vector<uint8_t> data = TagTestUtils::id3v2(
        3, TagTestUtils::frame(3, "TIT2", TagTestUtils::textPayload("Logged")));
    auto tag = Tag::ID3v2Tag::parse(data.data(), data.size());
    ASSERT_NOT_NULL(tag.get(), "tag parsed");
    std::string log = readLog(path);
    ASSERT_TRUE(contains(log, "ID3v2Tag::parse"), "container reader logs on id3v2");
    ASSERT_TRUE(contains(log, "TIT2"), "frame loop logs on frame");
}

static void test_disabled_by_default() {
    Debug::shutdown();
    ASSERT_FALSE(Debug::isChannelEnabled("tag"), "no channels before init");
    ASSERT_FALSE(Debug::isChannelEnabled("all"), "all is a channel name, not a default");
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;
    TestSuite suite("Debug System Tests");
    
    suite.addTest("Debug_DisabledByDefault", test_disabled_by_default);
    suite.addTest(std::make_unique<LogFileTest>("Debug_EnabledChannel",
        std::vector<std::string>{"id3v2"}, check_enabled_channel));
    suite.addTest(std::make_unique<LogFileTest>("Debug_LocationLogging",
        std::vector<std::string>{"tag"}, check_location_logging));
    suite.addTest(std::make_unique<LogFileTest>("Debug_AllChannel",
        std::vector<std::string>{"all"}, check_all_channel));
    suite.addTest(std::make_unique<LogFileTest>("Debug_LazyLogging",
        std::vector<std::string>{"tag"}, check_lazy_logging));
    suite.addTest(std::make_unique<LogFileTest>("Debug_ParserLogs",
        std::vector<std::string>{"id3v2", "frame"}, check_parser_logs));
    
    auto results = suite.runAll();
    suite.printResults(results);
    
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
