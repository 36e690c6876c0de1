// SPDX-License-Identifier: Apache-2.0
// Stale connections are reaped and leave their room like a closed socket.
#include "server/lobby/room_registry.hpp"
#include "server/lobby/session_coordinator.hpp"
#include "server/net/broadcast_gateway.hpp"
#include "server/net/connection_manager.hpp"
#include "server/net/heartbeat.hpp"
#include "server/net/listener.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace std::chrono_literals;

int main()
{
    pongd::net::ConnectionManager connections;
    pongd::net::ConnectionGateway gateway{connections};
    pongd::lobby::RoomRegistry registry{pongd::game::GameConfig{}, gateway, nullptr, 3};
    pongd::lobby::SessionCoordinator coordinator{registry, pongd::lobby::CoordinatorConfig{}};

    auto a = connections.add_detached();
    auto b = connections.add_detached();
    coordinator.join(a->connection_id);
    coordinator.join(b->connection_id);
    assert(registry.find("room1")->ticking());

    // Fresh connections survive a sweep at the current time.
    auto now = std::chrono::steady_clock::now();
    assert(pongd::net::reap_stale_connections(connections, coordinator, 15s, now) == 0);
    assert(connections.size() == 2);

    // Both go quiet for an hour (test-only direct write; nothing else touches
    // these connections here). b then moves its paddle without ever sending a
    // heartbeat: live input keeps it alive, a is reaped.
    a->last_heartbeat = now - 1h;
    b->last_heartbeat = now - 1h;
    pongd::ClientMessage move;
    move.mutable_move_paddle()->set_direction(pongd::DIRECTION_DOWN);
    pongd::net::handle_inbound(connections, coordinator, b, move);
    assert(registry.find("room1")->snapshot().right.y == 165.0);
    auto sweep_at = std::chrono::steady_clock::now();
    assert(connections.snapshot_stale(15s, sweep_at).size() == 1);
    assert(pongd::net::reap_stale_connections(connections, coordinator, 15s, sweep_at) == 1);
    assert(connections.is_closed(a));
    assert(!connections.is_closed(b));
    assert(!registry.room_id_of(a->connection_id));

    // The survivor is told and the room stops ticking.
    bool told = false;
    for (auto &m : connections.drain_messages(b))
        if (m.has_player_disconnected())
            told = true;
    assert(told);
    assert(!registry.find("room1")->ticking());

    // An explicit heartbeat refreshes too and is answered with the echoed time.
    b->last_heartbeat = now - 1h;
    pongd::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(777);
    pongd::net::handle_inbound(connections, coordinator, b, hb);
    auto replies = connections.drain_messages(b);
    assert(replies.size() == 1 && replies[0].has_heartbeat_response());
    assert(replies[0].heartbeat_response().client_time_ms() == 777);
    assert(replies[0].heartbeat_response().connection_id() == b->connection_id);

    // A second sweep finds nothing new.
    assert(pongd::net::reap_stale_connections(connections, coordinator, 15s, std::chrono::steady_clock::now()) == 0);
    std::cout << "unit_heartbeat_timeout OK" << std::endl;
    return 0;
}
