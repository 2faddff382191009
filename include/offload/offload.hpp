#pragma once

/**
 * @file
 * @brief Umbrella include for the complete liboffload public API.
 */

#include "offload/core/error.hpp"
#include "offload/core/log.hpp"
#include "offload/core/result.hpp"
#include "offload/core/unique_fd.hpp"
#include "offload/epoll/reactor.hpp"
#include "offload/process/command.hpp"
#include "offload/runtime/cancel.hpp"
#include "offload/runtime/main_loop.hpp"
#include "offload/runtime/operation_slot.hpp"
#include "offload/runtime/outcome.hpp"
#include "offload/runtime/work_context.hpp"
#include "offload/runtime/work_request.hpp"
#include "offload/runtime/worker.hpp"
#include "offload/runtime/worker_pool.hpp"
