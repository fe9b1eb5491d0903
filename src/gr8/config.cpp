/**
 * @file config.cpp
 * @brief Range checks for InterpreterConfig.
 *
 * @copyright GPL-2.0-or-later
 */

#include "gr8/config.h"

namespace gr8 {

namespace {

constexpr uint32_t kMaxTimerHz = 1000;

} // namespace

std::vector<std::string> InterpreterConfig::validate() const {
    std::vector<std::string> errors;
    if (timer_hz == 0) {
        errors.push_back("Timer rate must be at least 1 Hz");
    }
    if (timer_hz > kMaxTimerHz) {
        errors.push_back("Timer rate cannot exceed 1000 Hz");
    }
    if (sprite_edge != SpriteEdge::Clip && sprite_edge != SpriteEdge::Wrap) {
        errors.push_back("Invalid sprite edge policy");
    }
    return errors;
}

} // namespace gr8
