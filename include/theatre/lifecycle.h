#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "extended_error.h"
#include "theatre/export.h"
#include <atomic>
#include <condition_variable>
#include <mutex>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace theatre {

/** \struct termination_flag_t
 *  \brief one-way "should die" flag, shared between handles and the worker
 *
 * The flag is set by `kill()` from any thread and is observed by the worker
 * between message interpretations only.
 */
struct THEATRE_API termination_flag_t {
    /** \brief raises the flag, returns `true` only for the first caller */
    bool set() noexcept;

    /** \brief checks whether the flag has been raised */
    bool is_set() const noexcept;

  private:
    std::atomic_bool flag{false};
};

/** \struct death_latch_t
 *  \brief lets any number of threads block until the actor worker has finished
 *
 * The latch is released exactly once, by the worker, when it leaves the
 * message loop. All waiters, including ones which arrive after the release,
 * are let through.
 */
struct THEATRE_API death_latch_t {
    /** \brief marks the actor as dead and wakes up all waiters
     *
     * The `reason` is recorded only for the first release, subsequent
     * calls are ignored.
     */
    void release(const extended_error_ptr_t &reason) noexcept;

    /** \brief blocks the calling thread until the latch is released */
    void wait() noexcept;

    /** \brief non-blocking check of the latch state */
    bool is_dead() noexcept;

    /** \brief returns the recorded shutdown reason, `null` while alive */
    extended_error_ptr_t get_reason() noexcept;

  private:
    std::mutex mutex;
    std::condition_variable cv;
    bool dead = false;
    extended_error_ptr_t reason;
};

} // namespace theatre

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
