#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <boost/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

namespace theatre {

/** \brief thread-safe intrusive pointer policy
 *
 * Actor state is always shared between the worker thread and the handle
 * holders, so the counter is never downgraded to the thread-unsafe one.
 */
using counter_policy_t = boost::thread_safe_counter;

/** \brief base class to inject ref-counter with the specified policiy */
template <typename T> using arc_base_t = boost::intrusive_ref_counter<T, counter_policy_t>;

/** \brief alias for intrusive pointer */
template <typename T> using intrusive_ptr_t = boost::intrusive_ptr<T>;

} // namespace theatre
