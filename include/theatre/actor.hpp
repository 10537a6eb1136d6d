#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "actor_config.h"
#include "actor_state.hpp"
#include "interpreter.h"
#include "worker.hpp"
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace theatre {

/** \struct weak_actor_t
 *  \brief send-only actor handle
 *
 * The weak handle is able to deliver messages, but it is not able to kill
 * the actor or wait its death. It does not keep the mailbox connected, i.e.
 * when all strong handles are gone, the actor dies even if there are weak
 * handles.
 *
 */
template <typename Message> struct weak_actor_t {
    /** \brief constructs handle, not bound to any actor */
    weak_actor_t() noexcept = default;

    /** \brief constructs handle to the actor with the specified shared state */
    explicit weak_actor_t(actor_state_ptr_t<Message> state_) noexcept : state{std::move(state_)} {}

    /** \brief enqueues the message into actor mailbox
     *
     * Returns `error_code_t::dead_actor` if the actor worker has already exited.
     */
    std::error_code tell(Message message) const {
        if (!state) {
            return make_error_code(error_code_t::dead_actor);
        }
        return state->post(std::move(message));
    }

  private:
    actor_state_ptr_t<Message> state;
};

/** \struct actor_t
 *  \brief strong actor handle
 *
 * The handle is cheap to copy; all copies refer to the same actor, any of
 * them might `kill()` the actor or `wait()` for its death. Each strong handle
 * keeps the actor mailbox connected; when the last one is destroyed (or
 * detached via `wait()`), the actor worker treats that as stop request.
 *
 */
template <typename Message> struct actor_t {
    /** \brief alias for message type */
    using message_t = Message;

    /** \brief alias for weak (send-only) handle */
    using weak_t = weak_actor_t<Message>;

    /** \brief constructs handle, not bound to any actor */
    actor_t() noexcept = default;

    /** \brief takes ownership of the (already acquired) sender slot of the actor */
    explicit actor_t(actor_state_ptr_t<Message> state_) noexcept : state{std::move(state_)}, attached{true} {}

    actor_t(const actor_t &other) noexcept : state{other.state}, attached{other.attached} {
        if (attached) {
            state->mailbox.acquire_sender();
        }
    }

    actor_t(actor_t &&other) noexcept : state{std::move(other.state)}, attached{other.attached} {
        other.attached = false;
    }

    actor_t &operator=(actor_t other) noexcept {
        std::swap(state, other.state);
        std::swap(attached, other.attached);
        return *this;
    }

    ~actor_t() { detach(); }

    /** \brief enqueues the message into actor mailbox
     *
     * Returns `error_code_t::dead_actor` if the actor worker has already exited
     * or if the handle has been detached by `wait()`.
     */
    std::error_code tell(Message message) const {
        if (!attached) {
            return make_error_code(error_code_t::dead_actor);
        }
        return state->post(std::move(message));
    }

    /** \brief asks the actor to die
     *
     * Pending messages are either interpreted or discarded, depending on the
     * termination policy. Killing already killed or dead actor is no-op.
     */
    void kill() {
        if (state) {
            state->terminate();
        }
    }

    /** \brief detaches the handle from the mailbox and blocks until the actor dies
     *
     * After the call the handle is not able to send messages anymore.
     */
    void wait() noexcept {
        if (!state) {
            return;
        }
        detach();
        state->latch.wait();
    }

    /** \brief non-blocking check whether the actor worker has exited */
    bool is_dead() const noexcept { return state && state->latch.is_dead(); }

    /** \brief returns send-only handle to the same actor */
    weak_t weak() const noexcept { return weak_t{state}; }

    /** \brief returns the reason of actor death, `null` while actor is alive */
    extended_error_ptr_t get_shutdown_reason() const noexcept {
        return state ? state->latch.get_reason() : extended_error_ptr_t{};
    }

    /** \brief returns human-readable actor identity, empty for unbound handle */
    const std::string &get_identity() const noexcept {
        static const std::string unbound;
        return state ? state->identity : unbound;
    }

  private:
    void detach() noexcept {
        if (attached) {
            attached = false;
            state->mailbox.release_sender();
        }
    }

    actor_state_ptr_t<Message> state;
    bool attached = false;
};

template <typename Message, typename Behavior> actor_t<Message> actor_config_builder_t<Message, Behavior>::finish() && {
    if (!validate()) {
        throw std::system_error(make_error_code(error_code_t::actor_misconfigured));
    }
    auto state = actor_state_ptr_t<Message>(new actor_state_t<Message>(config));
    actor_t<Message> actor(state);
    worker_t<Message, Behavior> worker(std::move(state), std::move(behavior), config);
    std::thread([worker = std::move(worker)]() mutable { worker.run(); }).detach();
    return actor;
}

/** \brief returns config builder of actor with the interpreter, which never self-terminates
 *
 * The interpreter is moved (or copied) into the actor worker.
 */
template <typename Message, typename Interpreter> auto make_actor(Interpreter &&interpreter) {
    using value_t = std::decay_t<Interpreter>;
    using behavior_t = details::persistent_behavior_t<Message, value_t>;
    return actor_config_builder_t<Message, behavior_t>(behavior_t(value_t(std::forward<Interpreter>(interpreter))));
}

/** \brief returns config builder of actor with self-terminating interpreter */
template <typename Message, typename Interpreter> auto make_suicidal_actor(Interpreter &&interpreter) {
    using value_t = std::decay_t<Interpreter>;
    using behavior_t = details::suicidal_behavior_t<Message, value_t>;
    return actor_config_builder_t<Message, behavior_t>(behavior_t(value_t(std::forward<Interpreter>(interpreter))));
}

/** \brief spawns actor, which interprets all pending messages before death */
template <typename Message, typename Interpreter> actor_t<Message> spawn_graceful(Interpreter &&interpreter) {
    return make_actor<Message>(std::forward<Interpreter>(interpreter)).policy(termination_policy_t::graceful).finish();
}

/** \brief spawns actor, which discards all pending messages on death */
template <typename Message, typename Interpreter> actor_t<Message> spawn_disgraceful(Interpreter &&interpreter) {
    return make_actor<Message>(std::forward<Interpreter>(interpreter))
        .policy(termination_policy_t::disgraceful)
        .finish();
}

/** \brief spawns actor, which might kill itself after interpreting a message */
template <typename Message, typename Interpreter> actor_t<Message> spawn_suicidal(Interpreter &&interpreter) {
    return make_suicidal_actor<Message>(std::forward<Interpreter>(interpreter)).finish();
}

} // namespace theatre
