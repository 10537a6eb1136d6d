//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre/error_code.h"

namespace theatre {
namespace details {

const char *error_code_category::name() const noexcept { return "theatre_error"; }
const char *shutdown_code_category::name() const noexcept { return "theatre_shutdown"; }

std::string error_code_category::message(int c) const {
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        return "success";
    case error_code_t::dead_actor:
        return "actor is dead";
    case error_code_t::interpreter_failure:
        return "interpreter failure";
    case error_code_t::actor_misconfigured:
        return "actor is misconfigured";
    }
    return "unknown";
}

std::string shutdown_code_category::message(int c) const {
    switch (static_cast<shutdown_code_t>(c)) {
    case shutdown_code_t::normal:
        return "normal shutdown";
    case shutdown_code_t::self_terminated:
        return "actor shutdown has been requested by interpreter";
    case shutdown_code_t::abandoned:
        return "actor shutdown due to all handles release";
    case shutdown_code_t::failure_escalation:
        return "actor shutdown due to interpreter failure";
    }
    return "unknown shutdown reason";
}

} // namespace details
} // namespace theatre

namespace theatre {

const static details::error_code_category error_category;
const static details::shutdown_code_category shutdown_category;
const details::error_code_category &error_code_category() { return error_category; }
const details::shutdown_code_category &shutdown_code_category() { return shutdown_category; }

} // namespace theatre
