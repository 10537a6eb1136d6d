#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "diagnostics.h"
#include "forward.hpp"
#include "policy.h"
#include <cstddef>
#include <string>
#include <utility>

namespace theatre {

/** \struct actor_config_t
 * \brief basic actor configuration: termination policy, identity, mailbox tuning etc.
 */
struct actor_config_t {
    /** \brief what to do with pending messages, when the actor is killed */
    termination_policy_t policy = termination_policy_t::graceful;

    /** \brief human-readable actor name, used in logs and errors */
    std::string identity;

    /** \brief preallocated nodes in the lock-free mailbox queue */
    std::size_t inbound_queue_size = 64;

    /**
     * \brief How much time worker will spend in polling empty mailbox before switching into
     * sleep mode (i.e. waiting messages from other threads)
     */
    pt::time_duration poll_duration = pt::time_duration{};

    /** \brief kill the actor, when interpreter throws */
    bool escalate_failure = false;

    /** \brief receiver of interpreter failures */
    failure_handler_t failure_handler = &diagnostics::report_failure;

    /** \brief output lifecycle transitions to `std::cout` */
    bool inspect = false;
};

/** \brief actor config builder
 *
 * The builder owns the interpreter (wrapped into behavior adapter) until
 * `finish()` moves it into the newly spawned worker.
 *
 */
template <typename Message, typename Behavior> struct actor_config_builder_t {
    /** \brief final builder class */
    using builder_t = actor_config_builder_t;

    /** \brief handle type, returned by `finish()` */
    using actor_ptr_t = actor_t<Message>;

    /** \brief the currently build config */
    actor_config_t config;

    /** \brief interpreter adapter to be moved into worker */
    Behavior behavior;

    /** \brief ctor with interpreter adapter */
    explicit actor_config_builder_t(Behavior &&behavior_) : behavior{std::move(behavior_)} {
        config.inspect = diagnostics::inspection_enabled();
        if constexpr (Behavior::self_terminating) {
            config.policy = termination_policy_t::immediate;
        }
    }

    /** \brief setter for termination policy */
    builder_t &&policy(termination_policy_t value) && noexcept {
        config.policy = value;
        return std::move(*this);
    }

    /** \brief setter for actor identity */
    builder_t &&identity(const std::string &value) && {
        config.identity = value;
        return std::move(*this);
    }

    /** \brief initial queue size for mailbox */
    builder_t &&inbound_queue_size(std::size_t value) && noexcept {
        config.inbound_queue_size = value;
        return std::move(*this);
    }

    /** \brief how much time spend in active mailbox polling */
    builder_t &&poll_duration(const pt::time_duration &value) && noexcept {
        config.poll_duration = value;
        return std::move(*this);
    }

    builder_t &&escalate_failure(bool value = true) && noexcept {
        config.escalate_failure = value;
        return std::move(*this);
    }

    /** \brief setter for interpreter failures receiver
     *
     * The handler is invoked on the actor thread. If it throws, the failure
     * is reported to `std::cerr` instead.
     */
    builder_t &&failure_handler(failure_handler_t value) && {
        config.failure_handler = std::move(value);
        return std::move(*this);
    }

    builder_t &&inspect(bool value = true) && noexcept {
        config.inspect = value;
        return std::move(*this);
    }

    /** \brief checks whether config is valid
     *
     * Self-terminating actors always die immediately, other actors are
     * either graceful or disgraceful; the failure handler is mandatory.
     */
    bool validate() noexcept {
        if (!config.failure_handler) {
            return false;
        }
        if constexpr (Behavior::self_terminating) {
            return config.policy == termination_policy_t::immediate;
        } else {
            return config.policy != termination_policy_t::immediate;
        }
    }

    /** \brief spawns actor worker from the current config
     *
     * Throws `std::system_error` with `error_code_t::actor_misconfigured`
     * if the config is not valid.
     */
    actor_ptr_t finish() &&;
};

} // namespace theatre
