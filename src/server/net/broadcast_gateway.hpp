// SPDX-License-Identifier: Apache-2.0
// broadcast_gateway.hpp - Outbound fan-out seam between rooms and the transport.
#pragma once

#include "pongd.pb.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pongd::net {

class ConnectionManager;

// Rooms publish through this interface only. deliver() must not block: it
// hands the message to the transport and returns. A false return means the
// connection is gone; the caller treats that as a per-connection failure.
class BroadcastGateway
{
public:
    virtual ~BroadcastGateway() = default;

    virtual bool deliver(const std::string &connection_id, const pongd::ServerMessage &msg) = 0;

    bool send_to(const std::string &connection_id, const pongd::ServerMessage &msg);
    // Returns the number of members the message was handed to.
    size_t broadcast(const std::vector<std::string> &members, const pongd::ServerMessage &msg);
};

// Gateway backed by the per-connection outbound queues of a ConnectionManager.
class ConnectionGateway : public BroadcastGateway
{
public:
    explicit ConnectionGateway(ConnectionManager &connections)
        : m_connections(connections)
    {}

    bool deliver(const std::string &connection_id, const pongd::ServerMessage &msg) override;

private:
    ConnectionManager &m_connections;
};

} // namespace pongd::net
