//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre/diagnostics.h"
#include "theatre/extended_error.h"
#include <cstdlib>
#include <cstring>
#include <ios>
#include <iostream>
#include <sstream>

namespace theatre {
namespace diagnostics {

bool inspection_enabled() noexcept {
    auto var = std::getenv(inspect_variable);
    return var && *var && std::strcmp(var, "0") != 0;
}

void inspect(const std::string &identity, const char *event, const extended_error_ptr_t &reason) noexcept {
    std::stringstream out;
    out << "[theatre] " << identity << ": " << event;
    if (reason) {
        out << " (" << reason->message() << ")";
    }
    out << "\n";
    std::cout << out.str() << std::flush;
}

void report_failure(const extended_error_ptr_t &error) noexcept {
    std::cerr << "actor failure: " << error->message() << "\n";
}

std::string make_identity(const void *address) noexcept {
    std::stringstream out;
    out << std::hex << address;
    return out.str();
}

} // namespace diagnostics
} // namespace theatre
