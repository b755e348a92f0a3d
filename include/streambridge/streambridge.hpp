#pragma once

/**
 * @file
 * @brief Umbrella header for the public streambridge API.
 */

#include "streambridge/bridge/blocking_writer.hpp"
#include "streambridge/bridge/chunk_reader.hpp"
#include "streambridge/bridge/control_channel.hpp"
#include "streambridge/bridge/handoff_queue.hpp"
#include "streambridge/bridge/lifecycle_guard.hpp"
#include "streambridge/bridge/source.hpp"
#include "streambridge/bridge/stage_controller.hpp"
#include "streambridge/core/chunk.hpp"
#include "streambridge/core/error.hpp"
#include "streambridge/core/result.hpp"
#include "streambridge/runtime/blocking_pool.hpp"
#include "streambridge/runtime/cancel.hpp"
#include "streambridge/runtime/event_loop.hpp"
#include "streambridge/runtime/executor.hpp"
#include "streambridge/runtime/task.hpp"
#include "streambridge/runtime/wake_signal.hpp"
