// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors

#include <gtest/gtest.h>
#include "pal/keyboard.h"
#include "pal/types.h"

namespace pal {
namespace {

TEST(PalTypesTest, BytesPerPixel) {
    EXPECT_EQ(bytesPerPixel(PixelFormat::RGB565), 2u);
    EXPECT_EQ(bytesPerPixel(PixelFormat::RGB888), 3u);
    EXPECT_EQ(bytesPerPixel(PixelFormat::XRGB8888), 4u);
    EXPECT_EQ(bytesPerPixel(PixelFormat::RGBA8888), 4u);
    EXPECT_EQ(bytesPerPixel(PixelFormat::BGRA8888), 4u);
    EXPECT_EQ(bytesPerPixel(PixelFormat::Unknown), 0u);
}

TEST(PalTypesTest, OnlyOkIsOk) {
    EXPECT_TRUE(ok(Status::Ok));
    EXPECT_FALSE(ok(Status::NotInitialized));
    EXPECT_FALSE(ok(Status::AlreadyLocked));
    EXPECT_FALSE(ok(Status::DeviceError));
}

TEST(PalTypesTest, Names) {
    EXPECT_STREQ(toString(Status::Unavailable), "Unavailable");
    EXPECT_STREQ(toString(PixelFormat::XRGB8888), "XRGB8888");
    EXPECT_STREQ(toString(Backend::Auto), "Auto");
    EXPECT_STREQ(toString(Backend::SDL2), "SDL2");
    EXPECT_STREQ(toString(Backend::Headless), "Headless");
    EXPECT_STREQ(toString(HostEventType::FocusLost), "FocusLost");
}

TEST(PalTypesTest, SurfaceDefaultsToNothing) {
    const Surface surface;
    EXPECT_EQ(surface.pixels, nullptr);
    EXPECT_EQ(surface.pitch, 0u);
    EXPECT_EQ(surface.format, PixelFormat::Unknown);
}

} // namespace
} // namespace pal
