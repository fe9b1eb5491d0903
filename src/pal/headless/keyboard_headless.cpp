// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 GR8 Contributors
//
// Platform Abstraction Layer - Headless Keyboard

#include "pal/headless.h"

namespace pal {
namespace headless {

size_t Keyboard::poll(std::span<HostEvent> out) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    while (count < out.size() && !queue_.empty()) {
        out[count++] = queue_.front();
        queue_.pop_front();
    }
    return count;
}

void Keyboard::push(const HostEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(event);
}

void Keyboard::tap(uint16_t scancode) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back({HostEventType::KeyDown, scancode});
    queue_.push_back({HostEventType::KeyUp, scancode});
}

size_t Keyboard::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Keyboard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

} // namespace headless
} // namespace pal
