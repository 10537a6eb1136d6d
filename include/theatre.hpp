#pragma once

//
// Copyright (c) 2019-2026 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/** \file theatre.hpp
 * A convenience header to include theatre core.
 */

#include "theatre/actor.hpp"
#include "theatre/error_code.h"
#include "theatre/extended_error.h"
#include "theatre/interpreter.h"
#include "theatre/policy.h"

/// Basic namespace for all theatre functionalities
namespace theatre {}
