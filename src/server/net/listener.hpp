// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/lobby/session_coordinator.hpp"
#include "pongd.pb.h"
#include "server/net/connection_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>

namespace pongd::net {

// Applies one decoded inbound message. Any decoded frame counts as proof of
// life for the heartbeat timeout; heartbeats are answered here, everything
// else goes to the coordinator.
void handle_inbound(
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    const std::shared_ptr<Connection> &conn,
    const pongd::ClientMessage &msg);

// Starts the TCP accept loop on the given port. Each accepted socket gets a
// connection loop that decodes inbound frames into coordinator calls and
// flushes the connection's outbound queue. The read poll timeout is derived
// from tick_rate so queued state leaves within about half a tick.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    uint32_t tick_rate,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator);

} // namespace pongd::net
