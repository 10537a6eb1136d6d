#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <type_traits>
#include <utility>

namespace theatre {

/** \struct interpreter_t
 *  \brief the interface of message interpreter, which never asks to terminate the actor
 *
 * It is not mandatory to derive from the interface: any type with the
 * `process(Message &)` method, or any callable accepting `Message &` (e.g. a
 * lambda or a plain function) is accepted by `spawn_graceful` and
 * `spawn_disgraceful`.
 *
 * The interpreter is moved into the actor worker; it is accessed only from the
 * worker thread, hence it does not need any synchronization.
 */
template <typename Message> struct interpreter_t {
    virtual ~interpreter_t() = default;

    /** \brief interprets the message */
    virtual void process(Message &message) = 0;
};

/** \struct suicidal_interpreter_t
 *  \brief the interface of message interpreter, which might terminate the actor
 *
 * When `process` returns `true`, the actor immediately dies, discarding
 * all pending messages. Any type with `bool process(Message &)` method or a
 * callable returning `bool` is accepted by `spawn_suicidal`.
 */
template <typename Message> struct suicidal_interpreter_t {
    virtual ~suicidal_interpreter_t() = default;

    /** \brief interprets the message, returns `true` to terminate */
    virtual bool process(Message &message) = 0;
};

namespace details {

template <typename Interpreter, typename Message, typename = void> struct has_process : std::false_type {};

template <typename Interpreter, typename Message>
struct has_process<Interpreter, Message,
                   std::void_t<decltype(std::declval<Interpreter &>().process(std::declval<Message &>()))>>
    : std::true_type {};

/** \brief calls `process` method or the interpreter itself */
template <typename Interpreter, typename Message> decltype(auto) interpret(Interpreter &interpreter, Message &message) {
    if constexpr (has_process<Interpreter, Message>::value) {
        return interpreter.process(message);
    } else {
        static_assert(std::is_invocable_v<Interpreter &, Message &>,
                      "interpreter should have 'process(Message &)' method or be invocable with 'Message &'");
        return interpreter(message);
    }
}

template <typename Interpreter, typename Message>
using interpret_result_t = decltype(interpret(std::declval<Interpreter &>(), std::declval<Message &>()));

/** \struct persistent_behavior_t
 *  \brief adapts an interpreter which never terminates the actor
 */
template <typename Message, typename Interpreter> struct persistent_behavior_t {
    /** \brief self-termination is never requested */
    static constexpr bool self_terminating = false;

    explicit persistent_behavior_t(Interpreter &&interpreter_) : interpreter{std::move(interpreter_)} {}

    /** \brief interprets the message, result of interpreter (if any) is ignored */
    bool operator()(Message &message) {
        interpret(interpreter, message);
        return false;
    }

    Interpreter interpreter;
};

/** \struct suicidal_behavior_t
 *  \brief adapts an interpreter which reports whether the actor should die
 */
template <typename Message, typename Interpreter> struct suicidal_behavior_t {
    static_assert(std::is_convertible_v<interpret_result_t<Interpreter, Message>, bool>,
                  "self-terminating interpreter should return 'bool'");

    /** \brief self-termination might be requested after each message */
    static constexpr bool self_terminating = true;

    explicit suicidal_behavior_t(Interpreter &&interpreter_) : interpreter{std::move(interpreter_)} {}

    /** \brief interprets the message, returns `true` when the actor should die */
    bool operator()(Message &message) { return static_cast<bool>(interpret(interpreter, message)); }

    Interpreter interpreter;
};

} // namespace details

} // namespace theatre
