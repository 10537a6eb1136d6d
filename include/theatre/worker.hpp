#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "actor_state.hpp"
#include "extended_error.h"
#include "state.h"
#include <exception>
#include <memory>
#include <string>

namespace theatre {

/** \struct worker_t
 *  \brief the message loop of an actor, executed on its dedicated thread
 *
 * The worker exclusively owns the interpreter (wrapped into `Behavior`
 * adapter). It goes through the following states:
 *
 * - `RUNNING`: blocking receive from the mailbox. The stop marker, the
 * disconnected mailbox (no strong handles left), the raised termination
 * flag (checked after each message) or the self-termination request of the
 * interpreter switch it into `DRAINING`.
 *
 * - `DRAINING`: with `graceful` policy all pending messages are interpreted
 * until the mailbox becomes empty (stop markers are skipped); with other
 * policies nothing is interpreted.
 *
 * - `DEAD`: the mailbox is closed, so any further `tell` is rejected, pending
 * messages are discarded, the interpreter is destroyed and finally the death
 * latch is released.
 *
 * Exceptions of any type thrown by the interpreter are reported to the
 * failure handler; the loop continues, unless `escalate_failure` is set, in
 * which case the actor dies immediately. A throwing failure handler is
 * replaced by `std::cerr` reporting.
 *
 */
template <typename Message, typename Behavior> struct worker_t {
    /** \brief intrusive pointer to the shared state */
    using state_ptr_t = actor_state_ptr_t<Message>;

    worker_t(state_ptr_t state_, Behavior &&behavior_, const actor_config_t &config)
        : state{std::move(state_)}, behavior{std::make_unique<Behavior>(std::move(behavior_))},
          policy{config.policy}, escalate_failure{config.escalate_failure}, failure_handler{config.failure_handler} {}

    worker_t(worker_t &&) = default;
    worker_t(const worker_t &) = delete;

    /** \brief executes the message loop until the actor dies */
    void run() noexcept {
        finalizer_t finalizer{*this};
        if (state->inspect) {
            diagnostics::inspect(state->identity, "spawned");
        }

        auto &mailbox = state->mailbox;
        while (worker_state == state_t::RUNNING) {
            auto envelope = mailbox.receive();
            if (!envelope) {
                stop(shutdown_code_t::abandoned, policy);
            } else if (envelope->is_stop()) {
                stop(shutdown_code_t::normal, policy);
            } else {
                deliver(*envelope->payload);
                if (worker_state == state_t::RUNNING && state->flag.is_set()) {
                    stop(shutdown_code_t::normal, policy);
                }
            }
        }

        while (drain_policy == termination_policy_t::graceful) {
            auto envelope = mailbox.try_receive();
            if (!envelope) {
                break;
            }
            if (!envelope->is_stop()) {
                deliver(*envelope->payload);
            }
        }
    }

  private:
    /** \brief performs death sequence on leaving message loop */
    struct finalizer_t {
        worker_t &worker;

        ~finalizer_t() {
            auto &state = *worker.state;
            worker.worker_state = state_t::DEAD;
            state.mailbox.close();
            worker.behavior.reset();
            auto reason = worker.reason;
            if (!reason) {
                reason = make_error(state.identity, make_error_code(shutdown_code_t::normal));
            }
            if (state.inspect) {
                diagnostics::inspect(state.identity, "dead", reason);
            }
            state.latch.release(reason);
        }
    };

    void deliver(Message &message) noexcept {
        try {
            if ((*behavior)(message)) {
                stop(shutdown_code_t::self_terminated, termination_policy_t::immediate);
            }
        } catch (const std::exception &ex) {
            on_failure(ex.what());
        } catch (...) {
            on_failure("unknown exception");
        }
    }

    void on_failure(const char *details) noexcept {
        auto ec = make_error_code(error_code_t::interpreter_failure);
        auto error = make_error(state->identity, ec, {}, details);
        report(error);
        if (escalate_failure) {
            stop(shutdown_code_t::failure_escalation, termination_policy_t::immediate, error);
        }
    }

    /** \brief passes the failure to the handler, falls back to `std::cerr` if the handler throws */
    void report(const extended_error_ptr_t &error) noexcept {
        try {
            failure_handler(error);
        } catch (const std::exception &ex) {
            diagnostics::report_failure(error);
            auto ec = make_error_code(error_code_t::interpreter_failure);
            diagnostics::report_failure(make_error(state->identity, ec, {}, std::string("failure handler: ") + ex.what()));
        } catch (...) {
            diagnostics::report_failure(error);
            auto ec = make_error_code(error_code_t::interpreter_failure);
            diagnostics::report_failure(make_error(state->identity, ec, {}, "failure handler: unknown exception"));
        }
    }

    void stop(shutdown_code_t code, termination_policy_t drain_policy_, const extended_error_ptr_t &cause = {}) noexcept {
        worker_state = state_t::DRAINING;
        drain_policy = drain_policy_;
        reason = make_error(state->identity, make_error_code(code), cause);
        if (state->inspect) {
            diagnostics::inspect(state->identity, "draining", reason);
        }
    }

    state_ptr_t state;
    std::unique_ptr<Behavior> behavior;
    termination_policy_t policy;
    bool escalate_failure;
    failure_handler_t failure_handler;

    state_t worker_state = state_t::RUNNING;

    /** \brief which policy is applied to the mailbox leftovers, defined on leaving `RUNNING` */
    termination_policy_t drain_policy = termination_policy_t::immediate;
    extended_error_ptr_t reason;
};

} // namespace theatre
