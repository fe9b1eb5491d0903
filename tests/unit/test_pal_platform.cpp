// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors

#include <gtest/gtest.h>
#include "pal/headless.h"
#include "pal/platform.h"

namespace pal {
namespace {

class PalPlatformTest : public ::testing::Test {
protected:
    void SetUp() override {
        Platform::shutdown();
    }

    void TearDown() override {
        Platform::shutdown();
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalPlatformTest, InitializeHeadless) {
    EXPECT_FALSE(Platform::isInitialized());
    EXPECT_EQ(Platform::activeBackend(), Backend::Auto);

    EXPECT_EQ(Platform::initialize(Backend::Headless), Status::Ok);
    EXPECT_TRUE(Platform::isInitialized());
    EXPECT_EQ(Platform::activeBackend(), Backend::Headless);
}

TEST_F(PalPlatformTest, DoubleInitializeFails) {
    ASSERT_EQ(Platform::initialize(Backend::Headless), Status::Ok);
    EXPECT_EQ(Platform::initialize(Backend::Headless), Status::AlreadyInitialized);
}

TEST_F(PalPlatformTest, ShutdownResetsAndIsRepeatable) {
    ASSERT_EQ(Platform::initialize(Backend::Headless), Status::Ok);
    Platform::shutdown();
    Platform::shutdown();
    EXPECT_FALSE(Platform::isInitialized());
    EXPECT_EQ(Platform::activeBackend(), Backend::Auto);
    EXPECT_EQ(Platform::initialize(Backend::Headless), Status::Ok);
}

TEST_F(PalPlatformTest, AutoResolvesToPreferred) {
    EXPECT_EQ(Platform::resolve(Backend::Auto), Platform::preferredBackend());
    EXPECT_EQ(Platform::resolve(Backend::Headless), Backend::Headless);
    EXPECT_TRUE(Platform::isAvailable(Backend::Auto));
    EXPECT_TRUE(Platform::isAvailable(Backend::Headless));
}

#if defined(PAL_HAS_SDL2)
TEST_F(PalPlatformTest, PrefersSDL2WhenCompiledIn) {
    EXPECT_TRUE(Platform::isAvailable(Backend::SDL2));
    EXPECT_EQ(Platform::preferredBackend(), Backend::SDL2);
}
#else
TEST_F(PalPlatformTest, FallsBackToHeadlessWithoutSDL2) {
    EXPECT_FALSE(Platform::isAvailable(Backend::SDL2));
    EXPECT_EQ(Platform::preferredBackend(), Backend::Headless);
    EXPECT_EQ(Platform::initialize(Backend::SDL2), Status::Unavailable);
    EXPECT_FALSE(Platform::isInitialized());

    EXPECT_EQ(Platform::initialize(Backend::Auto), Status::Ok);
    EXPECT_EQ(Platform::activeBackend(), Backend::Headless);
}
#endif

// ═══════════════════════════════════════════════════════════════════════════
// Services
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(PalPlatformTest, NoServicesBeforeInitialize) {
    const Services services = Platform::createServices();
    EXPECT_FALSE(services);
    EXPECT_EQ(services.display, nullptr);
    EXPECT_EQ(services.clock, nullptr);
    EXPECT_EQ(services.keyboard, nullptr);
}

TEST_F(PalPlatformTest, HeadlessServicesAreHeadlessTypes) {
    ASSERT_EQ(Platform::initialize(Backend::Headless), Status::Ok);
    Services services = Platform::createServices();
    ASSERT_TRUE(services);

    EXPECT_NE(dynamic_cast<headless::Display*>(services.display.get()), nullptr);
    EXPECT_NE(dynamic_cast<headless::Clock*>(services.clock.get()), nullptr);
    EXPECT_NE(dynamic_cast<headless::Keyboard*>(services.keyboard.get()), nullptr);

    // Services come back unopened
    EXPECT_FALSE(services.display->isOpen());
}

} // namespace
} // namespace pal
