/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * gsl-lite is a PRIVATE dependency of gr8_core. Include this header from
 * implementation files and internal headers only.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace gr8 {

/**
 * @brief Scoped alias for gsl-lite v1 namespace.
 */
namespace gsl = ::gsl_lite;

} // namespace gr8
