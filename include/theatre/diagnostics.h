#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include "theatre/export.h"
#include <string>

namespace theatre {

/// lifecycle tracing and failure reporting helpers
namespace diagnostics {

/** \brief environment variable which turns on lifecycle inspection */
inline constexpr const char *inspect_variable = "THEATRE_INSPECT_LIFECYCLE";

/** \brief checks whether lifecycle inspection is requested via environment
 *
 * The inspection is on when `THEATRE_INSPECT_LIFECYCLE` is set to anything
 * except empty string or `0`.
 */
THEATRE_API bool inspection_enabled() noexcept;

/** \brief outputs lifecycle event of the actor to `std::cout`
 *
 * Example: `[theatre] echo: dead (echo normal shutdown)`
 */
THEATRE_API void inspect(const std::string &identity, const char *event,
                         const extended_error_ptr_t &reason = {}) noexcept;

/** \brief default failure handler: outputs the failure to `std::cerr` */
THEATRE_API void report_failure(const extended_error_ptr_t &error) noexcept;

/** \brief makes default actor identity, i.e. human-readable address */
THEATRE_API std::string make_identity(const void *address) noexcept;

} // namespace diagnostics

} // namespace theatre
