#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "actor_config.h"
#include "diagnostics.h"
#include "error_code.h"
#include "lifecycle.h"
#include "mailbox.hpp"
#include <string>

namespace theatre {

/** \struct actor_state_t
 *  \brief the part of actor shared between the worker and all handles
 *
 * The state outlives the worker as long as there is at least one handle
 * (strong or weak) referring it; it is destroyed when the worker has exited
 * and the last handle is gone.
 *
 */
template <typename Message> struct actor_state_t : arc_base_t<actor_state_t<Message>> {
    /** \brief alias for mailbox type */
    using mailbox_t = theatre::mailbox_t<Message>;

    /** \brief alias for mailbox item */
    using envelope_t = typename mailbox_t::envelope_t;

    /** \brief constructs the state from config; identity is generated if it is not provided */
    explicit actor_state_t(const actor_config_t &config)
        : mailbox{config.inbound_queue_size, config.poll_duration}, identity{config.identity},
          inspect{config.inspect} {
        if (identity.empty()) {
            identity = diagnostics::make_identity(this);
        }
    }

    /** \brief puts the message into the mailbox
     *
     * Returns `error_code_t::dead_actor` if the worker has already exited.
     */
    std::error_code post(Message &&message) {
        auto envelope = std::make_unique<envelope_t>(std::move(message));
        if (!mailbox.put(std::move(envelope))) {
            return make_error_code(error_code_t::dead_actor);
        }
        return {};
    }

    /** \brief raises termination flag and puts stop marker into the mailbox
     *
     * Only the first call has an effect.
     */
    void terminate() {
        if (!flag.set()) {
            return;
        }
        if (inspect) {
            diagnostics::inspect(identity, "kill requested");
        }
        auto stop = std::make_unique<envelope_t>();
        if (!mailbox.put(std::move(stop)) && inspect) {
            diagnostics::inspect(identity, "kill ignored, already dead");
        }
    }

    /** \brief message queue */
    mailbox_t mailbox;

    /** \brief set by `kill()` */
    termination_flag_t flag;

    /** \brief released by worker on exit */
    death_latch_t latch;

    /** \brief human-readable actor name */
    std::string identity;

    /** \brief whether lifecycle transitions should be traced */
    bool inspect;
};

} // namespace theatre
