/**
 * @file test_exceptions.cpp
 * @brief Unit tests for the exception hierarchy and abort replacements.
 */

#include <gtest/gtest.h>
#include <gr8/exceptions.h>
#include <string>

using namespace gr8;

// ─────────────────────────────────────────────────────────────────────────────
// EmulatorException
// ─────────────────────────────────────────────────────────────────────────────

TEST(EmulatorExceptionTest, MessageStored) {
    EmulatorException e("test message");
    EXPECT_STREQ(e.what(), "test message");
}

TEST(EmulatorExceptionTest, DerivesFromRuntimeError) {
    try {
        throw EmulatorException("boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "boom");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// MemoryAccessException
// ─────────────────────────────────────────────────────────────────────────────

TEST(MemoryAccessExceptionTest, MessageContainsAddress) {
    MemoryAccessException e(0x1000);
    EXPECT_NE(std::string(e.what()).find("0x1000"), std::string::npos);
    EXPECT_EQ(e.address(), 0x1000u);
    EXPECT_EQ(e.size(), 1u);
}

TEST(MemoryAccessExceptionTest, MessageContainsSize) {
    MemoryAccessException e(0x0FFE, 4);
    EXPECT_NE(std::string(e.what()).find("4 bytes"), std::string::npos);
    EXPECT_EQ(e.size(), 4u);
}

TEST(MemoryAccessExceptionTest, DerivesFromEmulatorException) {
    EXPECT_THROW(throw MemoryAccessException(0), EmulatorException);
}

// ─────────────────────────────────────────────────────────────────────────────
// FatalException
// ─────────────────────────────────────────────────────────────────────────────

TEST(FatalExceptionTest, SimpleMessage) {
    FatalException e("oops");
    EXPECT_STREQ(e.what(), "Fatal error: oops");
    EXPECT_STREQ(e.file(), "");
    EXPECT_EQ(e.line(), 0);
}

TEST(FatalExceptionTest, MessageContainsLocation) {
    FatalException e("oops", "runner.cpp", 12);
    EXPECT_NE(std::string(e.what()).find("runner.cpp:12"), std::string::npos);
    EXPECT_EQ(e.line(), 12);
}

// ─────────────────────────────────────────────────────────────────────────────
// ConfigException
// ─────────────────────────────────────────────────────────────────────────────

TEST(ConfigExceptionTest, SectionIsReported) {
    ConfigException e("runner", "Frame rate must be at least 1");
    EXPECT_EQ(e.section(), "runner");
    EXPECT_NE(std::string(e.what()).find("[runner]"), std::string::npos);
}

TEST(ConfigExceptionTest, PlainMessage) {
    ConfigException e("bad");
    EXPECT_TRUE(e.section().empty());
    EXPECT_STREQ(e.what(), "Configuration error: bad");
}

// ─────────────────────────────────────────────────────────────────────────────
// Library-mode macros
// ─────────────────────────────────────────────────────────────────────────────

#ifdef GR8_LIBRARY_MODE

TEST(LibraryModeTest, AssertThrowsFatalException) {
    EXPECT_NO_THROW(GR8_ASSERT(1 + 1 == 2, "arithmetic"));
    EXPECT_THROW(GR8_ASSERT(false, "forced"), FatalException);
}

TEST(LibraryModeTest, AbortThrowsFatalException) {
    try {
        GR8_ABORT("unreachable");
    } catch (const FatalException& e) {
        EXPECT_NE(std::string(e.what()).find("unreachable"), std::string::npos);
        EXPECT_GT(e.line(), 0);
    }
}

#endif
