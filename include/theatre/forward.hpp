#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <functional>

namespace theatre {

struct extended_error_t;
struct death_latch_t;
struct termination_flag_t;

template <typename Message> struct mailbox_t;
template <typename Message> struct actor_state_t;
template <typename Message> struct actor_t;
template <typename Message> struct weak_actor_t;

/** \brief intrusive pointer to exteneded error type */
using extended_error_ptr_t = intrusive_ptr_t<extended_error_t>;

/** \brief intrusive pointer to the shared part of an actor */
template <typename Message> using actor_state_ptr_t = intrusive_ptr_t<actor_state_t<Message>>;

/** \brief receives interpreter failure reports on the worker thread */
using failure_handler_t = std::function<void(const extended_error_ptr_t &)>;

namespace pt = boost::posix_time;

} // namespace theatre
