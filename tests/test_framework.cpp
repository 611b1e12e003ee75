/*
 * test_framework.cpp - Implementation of common test framework for ID3Peek
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_framework.h"
#include <iostream>
#include <iomanip>
#include <algorithm>

namespace TestFramework {

    // ========================================
    // TEST CASE IMPLEMENTATION
    // ========================================
    
    TestCase::TestCase(const std::string& name) 
        : m_name(name), m_passed(false) {
    }
    
    TestCaseInfo TestCase::run() {
        TestCaseInfo info(m_name);
        auto start_time = std::chrono::high_resolution_clock::now();
        
        try {
            // Clear previous state
            m_passed = false;
            m_failures.clear();
            
            // Execute test lifecycle
            setUp();
            runTest();
            tearDown();
            
            // If we get here, test passed
            m_passed = true;
            info.result = TestResult::PASSED;
            
        } catch (const AssertionFailure& e) {
            m_passed = false;
            info.result = TestResult::FAILED;
            info.failure_message = e.what();
            addFailure(e.what());
            runTearDownAfterFailure(info);
            
        } catch (const TestSkipped& e) {
            m_passed = true;
            info.result = TestResult::SKIPPED;
            info.failure_message = e.what();
            runTearDownAfterFailure(info);
            
        } catch (const TestSetupFailure& e) {
            m_passed = false;
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Setup failed: ") + e.what();
            addFailure(info.failure_message);
            
        } catch (const std::exception& e) {
            m_passed = false;
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Unexpected error: ") + e.what();
            addFailure(info.failure_message);
            runTearDownAfterFailure(info);
        }
        
        auto end_time = std::chrono::high_resolution_clock::now();
        info.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        
        return info;
    }
    
    void TestCase::runTearDownAfterFailure(TestCaseInfo& info) {
        try {
            tearDown();
        } catch (const std::exception& e) {
            // Keep the original failure, note the cleanup problem next to it
            addFailure(std::string("tearDown failed: ") + e.what());
            info.failure_message += std::string(" (tearDown failed: ") + e.what() + ")";
        }
    }
    
    const std::string& TestCase::getName() const {
        return m_name;
    }
    
    bool TestCase::hasPassed() const {
        return m_passed;
    }
    
    const std::vector<std::string>& TestCase::getFailures() const {
        return m_failures;
    }
    
    void TestCase::addFailure(const std::string& message) {
        m_failures.push_back(message);
    }

    // ========================================
    // TEST SUITE IMPLEMENTATION
    // ========================================
    
    TestSuite::TestSuite(const std::string& name) : m_name(name) {
    }
    
    void TestSuite::addTest(std::unique_ptr<TestCase> test) {
        if (test) {
            m_tests.push_back(std::move(test));
        }
    }
    
    void TestSuite::addTest(const std::string& name, std::function<void()> test_func) {
        auto test_case = std::make_unique<FunctionTestCase>(name, test_func);
        addTest(std::move(test_case));
    }
    
    std::vector<TestCaseInfo> TestSuite::runAll() {
        std::vector<TestCaseInfo> results;
        results.reserve(m_tests.size());
        
        std::cout << "Running test suite: " << m_name << std::endl;
        std::cout << "===================" << std::string(m_name.length(), '=') << std::endl;
        
        for (auto& test : m_tests) {
            std::cout << "Running " << test->getName() << "... ";
            std::cout.flush();
            
            TestCaseInfo result = test->run();
            results.push_back(result);
            
            // Print immediate result
            switch (result.result) {
                case TestResult::PASSED:
                    std::cout << "PASSED (" << result.execution_time.count() << "ms)" << std::endl;
                    break;
                case TestResult::FAILED:
                    std::cout << "FAILED (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  Error: " << result.failure_message << std::endl;
                    break;
                case TestResult::ERROR:
                    std::cout << "ERROR (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  Error: " << result.failure_message << std::endl;
                    break;
                case TestResult::SKIPPED:
                    std::cout << "SKIPPED (" << result.failure_message << ")" << std::endl;
                    break;
            }
        }
        
        return results;
    }
    
    TestCaseInfo TestSuite::runTest(const std::string& test_name) {
        for (auto& test : m_tests) {
            if (test->getName() == test_name) {
                return test->run();
            }
        }
        
        // Test not found
        TestCaseInfo not_found(test_name);
        not_found.result = TestResult::ERROR;
        not_found.failure_message = "Test not found: " + test_name;
        return not_found;
    }
    
    void TestSuite::printResults(const std::vector<TestCaseInfo>& results) {
        std::cout << std::endl;
        std::cout << "Test Results Summary" << std::endl;
        std::cout << "====================" << std::endl;
        
        int passed = getPassedCount(results);
        int failed = getFailureCount(results);
        int errors = 0;
        int skipped = 0;
        
        for (const auto& result : results) {
            if (result.result == TestResult::ERROR) errors++;
            else if (result.result == TestResult::SKIPPED) skipped++;
        }
        
        std::cout << "Total tests: " << results.size() << std::endl;
        std::cout << "Passed: " << passed << std::endl;
        std::cout << "Failed: " << failed << std::endl;
        std::cout << "Errors: " << errors << std::endl;
        std::cout << "Skipped: " << skipped << std::endl;
        std::cout << "Total time: " << getTotalTime(results).count() << "ms" << std::endl;
        
        // Print detailed failure information
        if (failed > 0 || errors > 0) {
            std::cout << std::endl << "Failure Details:" << std::endl;
            std::cout << "================" << std::endl;
            
            for (const auto& result : results) {
                if (result.result == TestResult::FAILED || result.result == TestResult::ERROR) {
                    std::cout << std::endl << "FAILED: " << result.name << std::endl;
                    std::cout << "  " << result.failure_message << std::endl;
                }
            }
        }
        
        std::cout << std::endl;
        if (failed == 0 && errors == 0) {
            std::cout << "All tests passed!" << std::endl;
        } else {
            std::cout << "Some tests failed. See details above." << std::endl;
        }
    }
    
    int TestSuite::getFailureCount(const std::vector<TestCaseInfo>& results) {
        return std::count_if(results.begin(), results.end(), 
            [](const TestCaseInfo& info) { return info.result == TestResult::FAILED; });
    }
    
    int TestSuite::getPassedCount(const std::vector<TestCaseInfo>& results) {
        return std::count_if(results.begin(), results.end(), 
            [](const TestCaseInfo& info) { return info.result == TestResult::PASSED; });
    }
    
    std::chrono::milliseconds TestSuite::getTotalTime(const std::vector<TestCaseInfo>& results) {
        std::chrono::milliseconds total(0);
        for (const auto& result : results) {
            total += result.execution_time;
        }
        return total;
    }
    
    const std::string& TestSuite::getName() const {
        return m_name;
    }
    
    size_t TestSuite::getTestCount() const {
        return m_tests.size();
    }
    
    std::vector<std::string> TestSuite::getTestNames() const {
        std::vector<std::string> names;
        names.reserve(m_tests.size());
        
        for (const auto& test : m_tests) {
            names.push_back(test->getName());
        }
        
        return names;
    }

    // ========================================
    // FUNCTION TEST CASE IMPLEMENTATION
    // ========================================
    
    FunctionTestCase::FunctionTestCase(const std::string& name, std::function<void()> test_func)
        : TestCase(name), m_test_func(test_func) {
    }
    
    void FunctionTestCase::runTest() {
        if (m_test_func) {
            m_test_func();
        } else {
            throw TestSetupFailure("Test function is null");
        }
    }

    // ========================================
    // ID3 FIXTURE BUILDERS IMPLEMENTATION
    // ========================================
    
    namespace TagTestUtils {
        
        Bytes synchsafe(uint32_t value) {
            return Bytes{
                static_cast<uint8_t>((value >> 21) & 0x7F),
                static_cast<uint8_t>((value >> 14) & 0x7F),
                static_cast<uint8_t>((value >> 7) & 0x7F),
                static_cast<uint8_t>(value & 0x7F)
            };
        }
        
        Bytes bigEndian(uint32_t value, size_t width) {
            Bytes out(width);
            for (size_t i = 0; i < width; ++i) {
                out[width - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
            }
            return out;
        }
        
        Bytes bytes(const std::string& text) {
            return Bytes(text.begin(), text.end());
        }
        
        Bytes concat(std::initializer_list<Bytes> parts) {
            Bytes out;
            for (const Bytes& part : parts) {
                out.insert(out.end(), part.begin(), part.end());
            }
            return out;
        }
        
        Bytes textPayload(const std::string& text, uint8_t encoding) {
            Bytes out{encoding};
            out.insert(out.end(), text.begin(), text.end());
            return out;
        }
        
        Bytes frame(uint8_t major, const std::string& id, const Bytes& payload, uint16_t flags) {
            Bytes out = bytes(id);
            if (major == 2) {
                Bytes size = bigEndian(static_cast<uint32_t>(payload.size()), 3);
                out.insert(out.end(), size.begin(), size.end());
            } else {
                Bytes size = major == 4 ? synchsafe(static_cast<uint32_t>(payload.size()))
                                        : bigEndian(static_cast<uint32_t>(payload.size()), 4);
                out.insert(out.end(), size.begin(), size.end());
                out.push_back(static_cast<uint8_t>(flags >> 8));
                out.push_back(static_cast<uint8_t>(flags & 0xFF));
            }
            out.insert(out.end(), payload.begin(), payload.end());
            return out;
        }
        
        Bytes id3v2(uint8_t major, const Bytes& frames, uint8_t flags, size_t padding) {
            Bytes out{'I', 'D', '3', major, 0, flags};
            Bytes size = synchsafe(static_cast<uint32_t>(frames.size() + padding));
            out.insert(out.end(), size.begin(), size.end());
            out.insert(out.end(), frames.begin(), frames.end());
            out.insert(out.end(), padding, 0);
            return out;
        }
        
        Bytes id3v1(const std::string& title, const std::string& artist, const std::string& album,
                    const std::string& year, const std::string& comment, uint8_t track, uint8_t genre) {
            Bytes out(128, 0);
            auto put = [&out](size_t offset, const std::string& text, size_t width) {
                std::copy_n(text.begin(), std::min(text.size(), width), out.begin() + offset);
            };
            put(0, "TAG", 3);
            put(3, title, 30);
            put(33, artist, 30);
            put(63, album, 30);
            put(93, year, 4);
            put(97, comment, track ? 28 : 30);
            if (track) {
                out[125] = 0;
                out[126] = track;
            }
            out[127] = genre;
            return out;
        }
        
        void assertBytesEqual(const Bytes& expected, const Bytes& actual, const std::string& message) {
            if (expected.size() != actual.size()) {
                std::ostringstream oss;
                oss << "Byte length mismatch: " << message
                    << " - Expected: " << expected.size() << ", Got: " << actual.size();
                throw AssertionFailure(oss.str());
            }
            for (size_t i = 0; i < expected.size(); ++i) {
                if (expected[i] != actual[i]) {
                    std::ostringstream oss;
                    oss << "Byte mismatch: " << message << " - at offset " << i
                        << " expected 0x" << std::hex << static_cast<int>(expected[i])
                        << ", got 0x" << static_cast<int>(actual[i]);
                    throw AssertionFailure(oss.str());
                }
            }
        }
    }

    // ========================================
    // TEST PATTERNS IMPLEMENTATION
    // ========================================
    
    namespace TestPatterns {
        
        void assertNoThrow(std::function<void()> test_func, const std::string& message) {
            try {
                test_func();
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << message << " - Unexpected exception: " << e.what();
                throw AssertionFailure(oss.str());
            }
        }
    }

} // namespace TestFramework