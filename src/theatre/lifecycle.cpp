//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "theatre/lifecycle.h"

using namespace theatre;

bool termination_flag_t::set() noexcept { return !flag.exchange(true, std::memory_order_acq_rel); }

bool termination_flag_t::is_set() const noexcept { return flag.load(std::memory_order_acquire); }

void death_latch_t::release(const extended_error_ptr_t &reason_) noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    if (dead) {
        return;
    }
    dead = true;
    reason = reason_;
    cv.notify_all();
}

void death_latch_t::wait() noexcept {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return dead; });
}

bool death_latch_t::is_dead() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return dead;
}

extended_error_ptr_t death_latch_t::get_reason() noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return reason;
}
