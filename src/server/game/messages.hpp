// SPDX-License-Identifier: Apache-2.0
// messages.hpp - Conversions between room state and wire messages.
#pragma once
#include "pongd.pb.h"
#include "server/game/game_state.hpp"

#include <optional>
#include <string>

namespace pongd::game {

pongd::Side to_proto(Side s);
std::optional<Direction> from_proto(pongd::Direction d);

void fill_game_state(const std::string &room_id, const GameState &st, pongd::GameState &out);

pongd::ServerMessage make_game_state(const std::string &room_id, const GameState &st);
pongd::ServerMessage make_paddle_assignment(Side s);
pongd::ServerMessage make_paddle_update(Side s, double y);
pongd::ServerMessage make_game_start();
pongd::ServerMessage make_player_disconnected();

} // namespace pongd::game
