// SPDX-License-Identifier: Apache-2.0
#include "server/net/broadcast_gateway.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/net/connection_manager.hpp"

namespace pongd::net {

bool BroadcastGateway::send_to(const std::string &connection_id, const pongd::ServerMessage &msg)
{
    auto &rt = pongd::metrics::runtime();
    if (deliver(connection_id, msg)) {
        rt.messages_delivered.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    rt.messages_undeliverable.fetch_add(1, std::memory_order_relaxed);
    pongd::log::debug("[gateway] undeliverable conn={} payload={}", connection_id, static_cast<int>(msg.payload_case()));
    return false;
}

size_t BroadcastGateway::broadcast(const std::vector<std::string> &members, const pongd::ServerMessage &msg)
{
    size_t delivered = 0;
    for (auto &m : members) {
        if (send_to(m, msg))
            ++delivered;
    }
    return delivered;
}

bool ConnectionGateway::deliver(const std::string &connection_id, const pongd::ServerMessage &msg)
{
    return m_connections.push_message(connection_id, msg);
}

} // namespace pongd::net
