#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

namespace theatre {

/** \brief state of actor worker in `theatre` */
enum class state_t {
    RUNNING,
    DRAINING,
    DEAD,
};

} // namespace theatre
