// SPDX-License-Identifier: Apache-2.0
#include "server/game/messages.hpp"

namespace pongd::game {

pongd::Side to_proto(Side s)
{
    return s == Side::left ? pongd::SIDE_LEFT : pongd::SIDE_RIGHT;
}

std::optional<Direction> from_proto(pongd::Direction d)
{
    switch (d) {
        case pongd::DIRECTION_UP:
            return Direction::up;
        case pongd::DIRECTION_DOWN:
            return Direction::down;
        default:
            return std::nullopt;
    }
}

void fill_game_state(const std::string &room_id, const GameState &st, pongd::GameState &out)
{
    out.set_room_id(room_id);
    out.set_server_tick(st.server_tick);
    auto *b = out.mutable_ball();
    b->set_x(st.ball.x);
    b->set_y(st.ball.y);
    b->set_dx(st.ball.dx);
    b->set_dy(st.ball.dy);
    auto *l = out.mutable_left();
    l->set_y(st.left.y);
    l->set_player_id(st.left.owner.value_or(""));
    auto *r = out.mutable_right();
    r->set_y(st.right.y);
    r->set_player_id(st.right.owner.value_or(""));
    out.mutable_score()->set_left(st.score_left);
    out.mutable_score()->set_right(st.score_right);
    out.set_active(st.active);
    for (auto &p : st.players)
        out.add_players(p);
}

pongd::ServerMessage make_game_state(const std::string &room_id, const GameState &st)
{
    pongd::ServerMessage msg;
    fill_game_state(room_id, st, *msg.mutable_game_state());
    return msg;
}

pongd::ServerMessage make_paddle_assignment(Side s)
{
    pongd::ServerMessage msg;
    msg.mutable_paddle_assignment()->set_side(to_proto(s));
    return msg;
}

pongd::ServerMessage make_paddle_update(Side s, double y)
{
    pongd::ServerMessage msg;
    auto *pu = msg.mutable_paddle_update();
    pu->set_side(to_proto(s));
    pu->set_y(y);
    return msg;
}

pongd::ServerMessage make_game_start()
{
    pongd::ServerMessage msg;
    msg.mutable_game_start();
    return msg;
}

pongd::ServerMessage make_player_disconnected()
{
    pongd::ServerMessage msg;
    msg.mutable_player_disconnected();
    return msg;
}

} // namespace pongd::game
