#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include "theatre/export.h"
#include <string>
#include <system_error>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace theatre {

/** \struct extended_error_t
 *  \brief Holds string context, error_code, optional details and the pointer to the following error.
 *
 * This is extension over std::error_code, to make it possible to identify the
 * context of the error (usually it is actor identity), to keep the failure
 * description (e.g. the `what()` of the exception thrown by an interpreter) and
 * to construct the chain of failures, that's why there is a smart pointer to the
 * next error.
 *
 */
struct THEATRE_API extended_error_t : arc_base_t<extended_error_t> {
    /** \brief error context, usually actor identity */
    std::string context;

    /** \brief abstract error code, describing occurred error */
    std::error_code ec;

    /** \brief free-form failure description, might be empty */
    std::string details;

    /** \brief pointer to the parent error */
    extended_error_ptr_t next;

    /** \brief constructs extended error by assembling all fields */
    extended_error_t(const std::string &context_, const std::error_code &ec_, const extended_error_ptr_t &next_ = {},
                     const std::string &details_ = {}) noexcept
        : context{context_}, ec{ec_}, details{details_}, next{next_} {}

    /** \brief human-readeable detailed description of the error
     *
     * First, it stringifies own error in accordance with the context and
     * details.
     *
     * Second, it recursively ask details on all following errors, appedning them
     * into the result. The result string is returned.
     */
    std::string message() const noexcept;

    /** \brief returns the last error in the chain (the original cause) */
    extended_error_ptr_t root() const noexcept;
};

/** \brief constructs smart pointer to the extened error */
THEATRE_API extended_error_ptr_t make_error(const std::string &context_, const std::error_code &ec_,
                                            const extended_error_ptr_t &next_ = {},
                                            const std::string &details_ = {}) noexcept;

} // namespace theatre

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
