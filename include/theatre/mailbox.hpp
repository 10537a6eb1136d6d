#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include <boost/lockfree/queue.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <new>
#include <optional>

namespace theatre {

/** \struct envelope_t
 *  \brief mailbox item: either user message or stop marker
 */
template <typename Message> struct envelope_t {
    /** \brief constructs stop marker */
    envelope_t() = default;

    /** \brief constructs envelope which delivers the message */
    explicit envelope_t(Message &&message) : payload{std::move(message)} {}

    /** \brief returns `true` if the envelope carries no message */
    inline bool is_stop() const noexcept { return !payload; }

    /** \brief user message, empty for stop marker */
    std::optional<Message> payload;
};

/** \struct mailbox_t
 *  \brief unbounded multi-producer single-consumer FIFO of envelopes
 *
 * Producers push envelopes into the lock-free queue and notify the consumer via
 * condition variable. The consumer (actor worker) first polls the queue for
 * `poll_duration` and only then falls asleep.
 *
 * The mailbox tracks the number of strong senders; when it drops to zero
 * and the queue has been drained, the mailbox is considered disconnected.
 * When the consumer closes the mailbox, all further pushes are rejected.
 *
 */
template <typename Message> struct mailbox_t {
    /** \brief alias for the mailbox item */
    using envelope_t = theatre::envelope_t<Message>;

    /** \brief owning pointer to the envelope */
    using envelope_ptr_t = std::unique_ptr<envelope_t>;

    /** \brief lock-free queue of raw envelope pointers */
    using queue_t = boost::lockfree::queue<envelope_t *>;

    /** \brief constructs mailbox with a single strong sender */
    mailbox_t(std::size_t inbound_queue_size, const pt::time_duration &poll_duration_)
        : queue{inbound_queue_size}, poll_duration{poll_duration_} {}

    mailbox_t(const mailbox_t &) = delete;
    mailbox_t(mailbox_t &&) = delete;

    ~mailbox_t() { discard(); }

    /** \brief registers one more strong sender */
    void acquire_sender() noexcept { senders.fetch_add(1, std::memory_order_relaxed); }

    /** \brief unregisters strong sender, wakes up the consumer on the last one */
    void release_sender() noexcept {
        if (senders.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            std::lock_guard<std::mutex> lock(mutex);
            cv.notify_one();
        }
    }

    /** \brief returns `true` while at least one strong sender exists */
    bool has_senders() const noexcept { return senders.load(std::memory_order_acquire) > 0; }

    /** \brief enqueues the envelope and wakes up the consumer
     *
     * Returns `false` if the consumer side has already been closed; the
     * envelope is destroyed in that case.
     *
     */
    bool put(envelope_ptr_t envelope) {
        if (closed.load(std::memory_order_acquire)) {
            return false;
        }
        if (!queue.push(envelope.get())) {
            throw std::bad_alloc();
        }
        envelope.release();
        std::lock_guard<std::mutex> lock(mutex);
        cv.notify_one();
        return true;
    }

    /** \brief blocking receive
     *
     * Returns `null` when there are no strong senders and nothing is left in
     * the queue.
     *
     */
    envelope_ptr_t receive() noexcept {
        using clock_t = std::chrono::steady_clock;
        envelope_t *ptr;
        if (queue.pop(ptr)) {
            return envelope_ptr_t(ptr);
        }

        auto total_us = poll_duration.total_microseconds();
        if (total_us > 0) {
            // fast stage, indirect spin-lock, cpu consuming
            auto deadline = clock_t::now() + std::chrono::microseconds{total_us};
            while (clock_t::now() < deadline && has_senders()) {
                if (queue.pop(ptr)) {
                    return envelope_ptr_t(ptr);
                }
            }
        }

        // wait notification, do not consume CPU
        bool popped = false;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&]() {
            popped = queue.pop(ptr);
            return popped || !has_senders();
        });
        return popped ? envelope_ptr_t(ptr) : envelope_ptr_t{};
    }

    /** \brief non-blocking receive, `null` when the queue is empty */
    envelope_ptr_t try_receive() noexcept {
        envelope_t *ptr;
        if (queue.pop(ptr)) {
            return envelope_ptr_t(ptr);
        }
        return {};
    }

    /** \brief rejects further pushes and destroys all pending envelopes */
    void close() noexcept {
        closed.store(true, std::memory_order_release);
        discard();
    }

    /** \brief returns `true` if the consumer side is gone */
    bool is_closed() const noexcept { return closed.load(std::memory_order_acquire); }

  private:
    void discard() noexcept {
        envelope_t *ptr;
        while (queue.pop(ptr)) {
            delete ptr;
        }
    }

    queue_t queue;
    pt::time_duration poll_duration;
    std::atomic_size_t senders{1};
    std::atomic_bool closed{false};
    std::mutex mutex;
    std::condition_variable cv;
};

} // namespace theatre
