/**
 * @file test_cpp_standard.cpp
 * @brief Compile-time verification that C++23 mode is active.
 *
 * This file serves as a CI gate to ensure the build system correctly
 * enables C++23. If this file compiles, the toolchain is configured correctly.
 *
 * @copyright GPL-2.0-or-later
 */

// ═══════════════════════════════════════════════════════════════════════════
// C++23 Standard Verification
// ═══════════════════════════════════════════════════════════════════════════

// Final C++23 is 202302L; GCC 12/13 report 202100L in -std=c++23 mode.
// MSVC uses _MSVC_LANG instead of __cplusplus for standard version.
#if defined(_MSVC_LANG)
    static_assert(_MSVC_LANG > 202002L,
        "MSVC is not compiling in C++23 mode. "
        "Check that /std:c++latest is set.");
#else
    static_assert(__cplusplus > 202002L,
        "Not compiling in C++23 mode. "
        "Check CMAKE_CXX_STANDARD and compiler flags.");
#endif

// ═══════════════════════════════════════════════════════════════════════════
// Library Feature Tests (compile-time verification)
// ═══════════════════════════════════════════════════════════════════════════

#include <version>

// std::expected (P0323R12) - core to our error model
#if defined(__cpp_lib_expected)
    static_assert(__cpp_lib_expected >= 202202L,
        "std::expected feature test macro too old");
#else
    #error "std::expected not available - C++23 library support incomplete"
#endif

// std::source_location - captured by every Error
#if !defined(__cpp_lib_source_location)
    #error "std::source_location not available"
#endif

// std::span - framebuffer and ROM views
#if !defined(__cpp_lib_span)
    #error "std::span not available"
#endif

// ═══════════════════════════════════════════════════════════════════════════
// Runtime Test (mainly for CI reporting)
// ═══════════════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <charconv>
#include <cstdint>
#include <expected>
#include <iostream>
#include <source_location>
#include <span>
#include <string>

namespace {

TEST(CppStandard, VersionMacro) {
#if defined(_MSVC_LANG)
    EXPECT_GT(_MSVC_LANG, 202002L) << "MSVC not in C++23 mode";
    std::cout << "_MSVC_LANG = " << _MSVC_LANG << std::endl;
#else
    EXPECT_GT(__cplusplus, 202002L) << "Not in C++23 mode";
    std::cout << "__cplusplus = " << __cplusplus << std::endl;
#endif
}

TEST(CppStandard, ExpectedAvailable) {
    std::expected<int, std::string> ok_result = 42;
    EXPECT_TRUE(ok_result.has_value());
    EXPECT_EQ(ok_result.value(), 42);

    std::expected<int, std::string> err_result = std::unexpected("error");
    EXPECT_FALSE(err_result.has_value());
    EXPECT_EQ(err_result.error(), "error");
}

TEST(CppStandard, ExpectedVoid) {
    std::expected<void, int> ok;
    EXPECT_TRUE(ok.has_value());

    std::expected<void, int> err = std::unexpected(7);
    EXPECT_FALSE(err.has_value());
    EXPECT_EQ(err.error(), 7);
}

TEST(CppStandard, SourceLocationAvailable) {
    const auto loc = std::source_location::current();
    EXPECT_GT(loc.line(), 0u);
    EXPECT_NE(std::string(loc.file_name()).find("test_cpp_standard"), std::string::npos);
}

TEST(CppStandard, FromCharsAvailable) {
    const std::string text = "0x2A";
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + 2, text.data() + text.size(), value, 16);
    EXPECT_EQ(ec, std::errc{});
    EXPECT_EQ(ptr, text.data() + text.size());
    EXPECT_EQ(value, 42u);
}

TEST(CppStandard, StaticExtentSpan) {
    int arr[] = {1, 2, 3, 4, 5};
    std::span<int, 5> s(arr);
    EXPECT_EQ(s.size(), 5u);
    EXPECT_EQ(s[0], 1);
    EXPECT_EQ((s.subspan<1, 3>()[2]), 4);
}

} // namespace
