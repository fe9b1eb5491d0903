/**
 * @file driver_config.cpp
 * @brief Range checks for RunnerConfig.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/driver_config.h"

namespace gr8 {

namespace {

constexpr uint32_t kMaxInstructionsPerSecond = 1'000'000;
constexpr uint32_t kMaxFrameRate = 240;
constexpr uint32_t kMaxWindowScale = 64;

} // namespace

std::vector<std::string> RunnerConfig::validate() const {
    std::vector<std::string> errors;
    if (instructions_per_second == 0) {
        errors.push_back("Instructions per second must be at least 1");
    }
    if (instructions_per_second > kMaxInstructionsPerSecond) {
        errors.push_back("Instructions per second cannot exceed 1000000");
    }
    if (frame_rate == 0) {
        errors.push_back("Frame rate must be at least 1");
    }
    if (frame_rate > kMaxFrameRate) {
        errors.push_back("Frame rate cannot exceed 240");
    }
    if (window_scale == 0) {
        errors.push_back("Window scale must be at least 1");
    }
    if (window_scale > kMaxWindowScale) {
        errors.push_back("Window scale cannot exceed 64");
    }
    if (foreground == background) {
        errors.push_back("Foreground and background colours must differ");
    }
    return errors;
}

} // namespace gr8
