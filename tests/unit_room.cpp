// SPDX-License-Identifier: Apache-2.0
// Room lifecycle driven by manual ticks (no scheduler): join/assignment,
// start, paddle moves, disconnect transitions and stop semantics.
#include "recording_gateway.hpp"
#include "server/game/room.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace pongd;
using PC = pongd::ServerMessage::PayloadCase;

int main()
{
    game::GameConfig cfg;
    test::RecordingGateway gw;
    auto room = std::make_shared<game::Room>("room1", cfg, gw, nullptr, 7u);

    // First join: left paddle, Waiting, assignment then full state to the joiner only.
    auto a = room->add_player("A");
    assert(a.side && *a.side == game::Side::left && !a.started);
    {
        auto msgs = gw.messages_for("A");
        assert(msgs.size() == 2);
        assert(msgs[0].payload_case() == PC::kPaddleAssignment);
        assert(msgs[0].paddle_assignment().side() == pongd::SIDE_LEFT);
        assert(msgs[1].payload_case() == PC::kGameState);
        assert(msgs[1].game_state().room_id() == "room1");
        assert(!msgs[1].game_state().active());
        assert(msgs[1].game_state().players_size() == 1);
    }
    assert(!room->ticking());
    assert(!room->tick()); // Waiting rooms do not tick

    // Second join: right paddle, Active, game_start to both.
    auto b = room->add_player("B");
    assert(b.side && *b.side == game::Side::right && b.started);
    assert(room->ticking());
    assert(gw.count("A", PC::kGameStart) == 1);
    assert(gw.count("B", PC::kGameStart) == 1);
    assert(gw.count("B", PC::kPaddleAssignment) == 1);
    {
        auto msgs = gw.messages_for("B");
        assert(msgs.back().payload_case() == PC::kGameState);
        assert(msgs.back().game_state().active());
        assert(msgs.back().game_state().players_size() == 2);
    }

    // Duplicate join of a member changes nothing.
    {
        size_t before = gw.total();
        auto again = room->add_player("A");
        assert(again.side && *again.side == game::Side::left && !again.started);
        assert(gw.total() == before);
        assert(room->player_count() == 2);
    }

    // Ticks broadcast the full state to every member.
    gw.clear();
    for (int i = 0; i < 5; ++i)
        assert(room->tick());
    assert(gw.count("A", PC::kGameState) == 5);
    assert(gw.count("B", PC::kGameState) == 5);
    {
        auto last = gw.messages_for("A").back().game_state();
        assert(last.server_tick() == 5);
        assert(last.active());
        auto snap = room->snapshot();
        assert(snap.server_tick == 5);
    }

    // Paddle moves: immediate single-field update to all members, clamped.
    gw.clear();
    assert(room->move_paddle("A", game::Direction::up));
    {
        auto up = gw.messages_for("B");
        assert(up.size() == 1 && up[0].payload_case() == PC::kPaddleUpdate);
        assert(up[0].paddle_update().side() == pongd::SIDE_LEFT);
        assert(std::fabs(up[0].paddle_update().y() - 155.0) < 1e-9);
    }
    for (int i = 0; i < 100; ++i)
        room->move_paddle("A", game::Direction::up);
    assert(room->snapshot().left.y == 0.0);
    for (int i = 0; i < 100; ++i)
        room->move_paddle("B", game::Direction::down);
    assert(room->snapshot().right.y == 320.0);

    // Spectator: member without a paddle, cannot move.
    auto c = room->add_player("C");
    assert(!c.side && !c.started);
    assert(gw.count("C", PC::kPaddleAssignment) == 0);
    assert(gw.count("C", PC::kGameState) == 1);
    assert(!room->move_paddle("C", game::Direction::down));
    assert(!room->move_paddle("nobody", game::Direction::down));
    assert(room->player_count() == 3);

    // Spectator leaving an Active room keeps it Active.
    {
        auto out = room->remove_player("C");
        assert(out.was_member && !out.vacated && !out.stopped && !out.empty);
        assert(room->ticking());
    }

    // Left owner leaves: loop stops, Waiting, remaining player told, keeps slot.
    gw.clear();
    {
        double right_y = room->snapshot().right.y;
        auto out = room->remove_player("A");
        assert(out.was_member && out.vacated && *out.vacated == game::Side::left);
        assert(out.stopped && !out.empty);
        assert(!room->ticking());
        auto snap = room->snapshot();
        assert(!snap.active);
        assert(!snap.left.owner);
        assert(snap.right.owner && *snap.right.owner == "B");
        assert(snap.right.y == right_y);
        assert(gw.count("B", PC::kPlayerDisconnected) == 1);
        assert(gw.count("A", PC::kPlayerDisconnected) == 0);
    }
    // No state is emitted after stop.
    {
        size_t before = gw.total();
        assert(!room->tick());
        assert(gw.total() == before);
    }

    // Unknown leave is a no-op.
    assert(!room->remove_player("A").was_member);

    // A new joiner takes the vacated left slot and restarts the match.
    auto d = room->add_player("D");
    assert(d.side && *d.side == game::Side::left && d.started);
    assert(room->ticking());

    // Both leave: last departure empties the room.
    assert(room->remove_player("D").stopped);
    {
        auto out = room->remove_player("B");
        assert(out.empty && !out.stopped);
        assert(room->player_count() == 0);
        assert(!room->ticking());
    }

    // Undeliverable members never block the tick for the others.
    {
        test::RecordingGateway gw2;
        gw2.set_unreachable("Y");
        auto r2 = std::make_shared<game::Room>("room2", cfg, gw2, nullptr, 1u);
        r2->add_player("X");
        r2->add_player("Y");
        assert(r2->ticking());
        assert(r2->tick());
        assert(gw2.count("X", PC::kGameState) == 2);
    }

    std::cout << "unit_room OK" << std::endl;
    return 0;
}
