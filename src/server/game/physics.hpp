// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Ball/paddle integration, collisions and scoring.
// Pure functions: no I/O and no shared state; randomness only through the
// caller-provided engine (ball resets).
#pragma once
#include "server/game/game_state.hpp"

#include <random>

namespace pongd::phys {

enum class StepOutcome
{
    none,
    left_scored,
    right_scored
};

// Highest legal paddle offset (paddle bottom touching the board edge).
double max_paddle_y(const game::GameConfig &cfg);
double clamp_paddle(double y, const game::GameConfig &cfg);
// Applies one fixed step in the given direction, clamped to the board.
double move_paddle(double y, game::Direction dir, const game::GameConfig &cfg);

// Centres the ball; dx and dy get magnitude ball_speed with independent random signs.
void reset_ball(game::Ball &ball, const game::GameConfig &cfg, std::mt19937 &rng);
game::GameState make_initial_state(const game::GameConfig &cfg, std::mt19937 &rng);

// Advances the ball one tick. Checks run in a fixed order: walls, left paddle,
// right paddle, bounds. There is no collision cooldown: a slow ball that stays
// inside a paddle's trigger zone is deflected again on the next tick, which
// recomputes dy from the new strike offset.
StepOutcome advance(game::GameState &state, const game::GameConfig &cfg, std::mt19937 &rng);

} // namespace pongd::phys
