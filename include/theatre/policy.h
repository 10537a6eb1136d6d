#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

namespace theatre {

/** \brief how the worker treats the mailbox leftovers once the actor was told to stop */
enum class termination_policy_t {
    /** \brief interpret all pending messages, then die */
    graceful = 1,

    /** \brief discard pending messages and die promptly */
    disgraceful,

    /** \brief discard pending messages; the policy of self-terminating actors
     * and of actors which escalated an interpreter failure
     */
    immediate,
};

} // namespace theatre
