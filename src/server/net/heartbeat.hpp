// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/lobby/session_coordinator.hpp"
#include "server/net/connection_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace pongd::net {

// Disconnects every connection whose last heartbeat is older than timeout.
// Returns the number of connections reaped.
size_t reap_stale_connections(
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    std::chrono::seconds timeout,
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    std::chrono::seconds timeout,
    const std::atomic_bool &stop);

} // namespace pongd::net
