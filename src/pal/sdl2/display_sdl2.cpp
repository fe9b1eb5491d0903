// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - SDL2 Display
//
// The surface is a streaming texture of the framebuffer's own size. The
// renderer stretches it over the window on present, so a frame costs one
// 64x32 upload regardless of window scale.

#include "pal/display.h"
#include <SDL.h>
#include <memory>

namespace pal {
namespace sdl2 {

namespace {

Uint32 toSdlFormat(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGB565:   return SDL_PIXELFORMAT_RGB565;
        case PixelFormat::RGB888:   return SDL_PIXELFORMAT_RGB24;
        case PixelFormat::XRGB8888: return SDL_PIXELFORMAT_RGB888;
        case PixelFormat::RGBA8888: return SDL_PIXELFORMAT_RGBA8888;
        case PixelFormat::BGRA8888: return SDL_PIXELFORMAT_BGRA8888;
        case PixelFormat::Unknown:  break;
    }
    return SDL_PIXELFORMAT_UNKNOWN;
}

} // anonymous namespace

class Display : public IDisplay {
public:
    Display() = default;
    ~Display() override { close(); }

    Display(const Display&) = delete;
    Display& operator=(const Display&) = delete;

    Status open(const DisplayConfig& config) override {
        if (window_) {
            return Status::AlreadyInitialized;
        }
        const Uint32 sdl_format = toSdlFormat(config.format);
        if (config.width == 0 || config.height == 0 || config.scale == 0 ||
            sdl_format == SDL_PIXELFORMAT_UNKNOWN) {
            return Status::InvalidParameter;
        }

        const int w = static_cast<int>(config.width);
        const int h = static_cast<int>(config.height);
        const int scale = static_cast<int>(config.scale);

        window_ = SDL_CreateWindow(config.title.c_str(),
                                   SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                   w * scale, h * scale,
                                   SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
        if (!window_) {
            return Status::DeviceError;
        }

        renderer_ = SDL_CreateRenderer(window_, -1, 0);
        if (!renderer_) {
            close();
            return Status::DeviceError;
        }
        // Letterbox instead of stretching unevenly when resized
        SDL_RenderSetLogicalSize(renderer_, w, h);
        SDL_RenderSetIntegerScale(renderer_, SDL_TRUE);

        texture_ = SDL_CreateTexture(renderer_, sdl_format, SDL_TEXTUREACCESS_STREAMING, w, h);
        if (!texture_) {
            close();
            return Status::DeviceError;
        }

        format_ = config.format;
        width_ = config.width;
        height_ = config.height;
        return Status::Ok;
    }

    void close() override {
        unlock();
        if (texture_) {
            SDL_DestroyTexture(texture_);
            texture_ = nullptr;
        }
        if (renderer_) {
            SDL_DestroyRenderer(renderer_);
            renderer_ = nullptr;
        }
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        format_ = PixelFormat::Unknown;
        width_ = 0;
        height_ = 0;
    }

    bool isOpen() const override {
        return texture_ != nullptr;
    }

    Status setTitle(std::string_view title) override {
        if (!window_) {
            return Status::NotInitialized;
        }
        const std::string copy(title);
        SDL_SetWindowTitle(window_, copy.c_str());
        return Status::Ok;
    }

    Status lock(Surface& surface) override {
        if (!texture_) {
            return Status::NotInitialized;
        }
        if (locked_) {
            return Status::AlreadyLocked;
        }

        void* pixels = nullptr;
        int pitch = 0;
        if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) {
            return Status::DeviceError;
        }

        surface.pixels = pixels;
        surface.pitch = static_cast<uint32_t>(pitch);
        surface.width = width_;
        surface.height = height_;
        surface.format = format_;
        locked_ = true;
        return Status::Ok;
    }

    void unlock() override {
        if (locked_ && texture_) {
            SDL_UnlockTexture(texture_);
        }
        locked_ = false;
    }

    bool isLocked() const override {
        return locked_;
    }

    Status present() override {
        if (!texture_) {
            return Status::NotInitialized;
        }
        if (locked_) {
            return Status::AlreadyLocked;
        }
        if (SDL_RenderClear(renderer_) != 0 ||
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr) != 0) {
            return Status::DeviceError;
        }
        SDL_RenderPresent(renderer_);
        return Status::Ok;
    }

private:
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    PixelFormat format_ = PixelFormat::Unknown;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    bool locked_ = false;
};

std::unique_ptr<IDisplay> createDisplay() {
    return std::make_unique<Display>();
}

} // namespace sdl2
} // namespace pal
