/**
 * @file contracts.h
 * @brief Unified contract checking infrastructure.
 *
 * Contract macros aligned with the FAIL/PANIC/TRAP error taxonomy:
 *
 * ┌─────────────────────────────────────────────────────────────────────────┐
 * │ Level       │ Macro              │ Action on Violation                 │
 * ├─────────────┼────────────────────┼─────────────────────────────────────┤
 * │ FAIL        │ GR8_REQUIRE        │ Returns Result<T> error             │
 * │ PANIC       │ GR8_ASSERT         │ Throws FatalException (lib mode)    │
 * │ TRAP        │ GR8_ABORT          │ Calls abort                         │
 * └─────────────────────────────────────────────────────────────────────────┘
 *
 * 1. GR8_REQUIRE - recoverable precondition failures (FAIL level)
 *    @code
 *    Result<void> Interpreter::load(std::span<const uint8_t> rom) {
 *        GR8_REQUIRE(rom.size() <= layout::kMaxRomSize,
 *                    ErrorCode::RomTooLarge, "ROM does not fit");
 *        // ...
 *    }
 *    @endcode
 *
 * 2. GR8_ASSERT - internal invariant violations (PANIC level)
 *
 * 3. GR8_ABORT - unrecoverable corruption (TRAP level). Rarely used.
 *
 * Integration with gsl-lite:
 *
 * gsl-lite provides gsl_Expects() and gsl_Ensures() for narrow contracts.
 * The build defines gsl_CONFIG_CONTRACT_VIOLATION_THROWS=1 for every GR8
 * target, so a violated narrow contract raises gsl_lite::fail_fast and is
 * handled like GR8_ASSERT in library mode.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gr8/error.h>
#include <gr8/exceptions.h>

namespace gr8 {

// ─────────────────────────────────────────────────────────────────────────────
// FAIL Level: Recoverable Precondition Checks
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Check precondition and return error if violated (FAIL level).
 */
#define GR8_REQUIRE(cond, code, msg) \
    GR8_CHECK(cond, code, msg)

/**
 * @brief Check precondition with printf-style message (FAIL level).
 *
 * @code
 *   GR8_REQUIRE_FMT(scale > 0, ErrorCode::ConfigValueInvalid,
 *                   "scale %d must be positive", scale);
 * @endcode
 */
#define GR8_REQUIRE_FMT(cond, code, fmt, ...) \
    do { \
        if (!(cond)) { \
            return ::gr8::Err(GR8_ERROR(code, fmt, __VA_ARGS__)); \
        } \
    } while (0)

} // namespace gr8
