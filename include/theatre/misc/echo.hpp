#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <iostream>
#include <ostream>

namespace theatre {
namespace misc {

/** \struct echo_t
 *  \brief sample interpreter, which outputs each message on a separate line
 *
 * Works with any message type, for which `operator<<` is defined.
 */
struct echo_t {
    /** \brief constructs echo, bound to the output stream */
    explicit echo_t(std::ostream &out_ = std::cout) noexcept : out{&out_} {}

    template <typename Message> void operator()(Message &message) const { *out << message << "\n"; }

  private:
    std::ostream *out;
};

} // namespace misc
} // namespace theatre
