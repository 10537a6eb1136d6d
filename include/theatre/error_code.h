#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre/export.h"
#include <string>
#include <system_error>

namespace theatre {

/** \brief error codes in theatre */
enum class error_code_t {
    success = 0,
    dead_actor,
    interpreter_failure,
    actor_misconfigured,
};

/** \brief the reasons of actor death */
enum class shutdown_code_t {
    normal = 0,
    self_terminated,
    abandoned,
    failure_escalation,
};

namespace details {

/** \brief category support for `theatre` error codes */
class THEATRE_API error_code_category : public std::error_category {
  public:
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

/** \brief category support for `theatre` shutdown reasons */
class THEATRE_API shutdown_code_category : public std::error_category {
  public:
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace details

/** \brief returns error code category for `theatre` error codes */
THEATRE_API const details::error_code_category &error_code_category();

/** \brief returns error code category for `theatre` shutdown reasons */
THEATRE_API const details::shutdown_code_category &shutdown_code_category();

/** \brief makes `std::error_code` from theatre error_code enumerations */
inline std::error_code make_error_code(const error_code_t e) { return {static_cast<int>(e), error_code_category()}; }
inline std::error_code make_error_code(const shutdown_code_t e) {
    return {static_cast<int>(e), shutdown_code_category()};
}

} // namespace theatre

namespace std {
template <> struct is_error_code_enum<theatre::error_code_t> : std::true_type {};
template <> struct is_error_code_enum<theatre::shutdown_code_t> : std::true_type {};
} // namespace std
