// SPDX-License-Identifier: Apache-2.0
#include "server/net/heartbeat.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace pongd::net {

size_t reap_stale_connections(
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    std::chrono::seconds timeout,
    std::chrono::steady_clock::time_point now)
{
    size_t reaped = 0;
    for (auto &c : connections.snapshot_stale(timeout, now)) {
        pongd::log::warn("[hb] disconnect timeout conn={} limit={}s", c->connection_id, timeout.count());
        coordinator.disconnect(c->connection_id);
        if (connections.remove(c))
            ++reaped;
    }
    return reaped;
}

coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler,
    ConnectionManager &connections,
    pongd::lobby::SessionCoordinator &coordinator,
    std::chrono::seconds timeout,
    const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    auto period = std::clamp<std::chrono::seconds>(timeout / 3, std::chrono::seconds(1), std::chrono::seconds(5));
    while (!stop.load()) {
        reap_stale_connections(connections, coordinator, timeout);
        co_await scheduler->yield_for(period);
    }
    co_return;
}

} // namespace pongd::net
