// SPDX-License-Identifier: Apache-2.0
// Coordinator entry points and inbound message dispatch.
#include "recording_gateway.hpp"
#include "server/lobby/session_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace pongd;
using PC = pongd::ServerMessage::PayloadCase;

static pongd::ClientMessage join_msg()
{
    pongd::ClientMessage m;
    m.mutable_join();
    return m;
}

static pongd::ClientMessage move_msg(pongd::Direction d)
{
    pongd::ClientMessage m;
    m.mutable_move_paddle()->set_direction(d);
    return m;
}

int main()
{
    assert(lobby::parse_room_policy("fixed") == lobby::RoomPolicy::fixed);
    assert(lobby::parse_room_policy("first_open") == lobby::RoomPolicy::first_open);
    bool threw = false;
    try {
        lobby::parse_room_policy("random");
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    game::GameConfig cfg;
    test::RecordingGateway gw;
    lobby::RoomRegistry reg{cfg, gw, nullptr, 5};
    lobby::SessionCoordinator coord{reg, lobby::CoordinatorConfig{lobby::RoomPolicy::fixed, "room1"}};

    // Inbound join through the dispatcher.
    coord.handle("A", join_msg());
    coord.handle("B", join_msg());
    assert(reg.room_id_of("A") == std::string("room1"));
    assert(reg.find("room1")->ticking());
    assert(gw.count("A", PC::kGameStart) == 1);

    // Duplicate join is a silent no-op.
    assert(!coord.join("A"));
    coord.handle("A", join_msg());
    assert(reg.find("room1")->player_count() == 2);

    // Moves route to the owned paddle.
    gw.clear();
    coord.handle("B", move_msg(pongd::DIRECTION_UP));
    assert(reg.find("room1")->snapshot().right.y == 155.0);
    assert(gw.count("A", PC::kPaddleUpdate) == 1);

    // Unspecified direction and heartbeats are ignored here.
    gw.clear();
    coord.handle("B", move_msg(pongd::DIRECTION_UNSPECIFIED));
    pongd::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(1);
    coord.handle("B", hb);
    assert(gw.total() == 0);

    // Spectators and strangers cannot move.
    coord.join("C");
    assert(!coord.move_paddle("C", game::Direction::up));
    assert(!coord.move_paddle("stranger", game::Direction::up));

    // Disconnect is idempotent.
    assert(coord.disconnect("A"));
    assert(!coord.disconnect("A"));
    assert(gw.count("B", PC::kPlayerDisconnected) == 1);
    assert(gw.count("C", PC::kPlayerDisconnected) == 1);
    assert(!reg.find("room1")->ticking());
    coord.disconnect("B");
    coord.disconnect("C");
    assert(reg.room_count() == 0);

    // Move after the room is gone.
    assert(!coord.move_paddle("B", game::Direction::down));

    // first_open policy names rooms itself.
    lobby::SessionCoordinator open{reg, lobby::CoordinatorConfig{lobby::RoomPolicy::first_open, "unused"}};
    auto r = open.join("X");
    assert(r && r->room_id != "unused" && r->side == game::Side::left);

    std::cout << "unit_session_coordinator OK" << std::endl;
    return 0;
}
