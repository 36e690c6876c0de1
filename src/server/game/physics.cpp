// SPDX-License-Identifier: Apache-2.0
#include "server/game/physics.hpp"

#include <algorithm>
#include <cmath>

namespace pongd::phys {

static double random_sign(std::mt19937 &rng)
{
    std::bernoulli_distribution coin(0.5);
    return coin(rng) ? 1.0 : -1.0;
}

static bool within_paddle(const game::Ball &ball, const game::PaddleSlot &paddle, const game::GameConfig &cfg)
{
    return ball.y >= paddle.y && ball.y <= paddle.y + cfg.paddle_height;
}

// Centre hits go straight, edge hits leave steeply.
static double deflect_dy(const game::Ball &ball, const game::PaddleSlot &paddle, const game::GameConfig &cfg)
{
    double hit = (ball.y - paddle.y) / cfg.paddle_height;
    return (hit - 0.5) * cfg.ball_speed * 2.0;
}

double max_paddle_y(const game::GameConfig &cfg)
{
    return std::max(0.0, cfg.board_height - cfg.paddle_height);
}

double clamp_paddle(double y, const game::GameConfig &cfg)
{
    return std::clamp(y, 0.0, max_paddle_y(cfg));
}

double move_paddle(double y, game::Direction dir, const game::GameConfig &cfg)
{
    double next = dir == game::Direction::up ? y - cfg.paddle_step : y + cfg.paddle_step;
    return clamp_paddle(next, cfg);
}

void reset_ball(game::Ball &ball, const game::GameConfig &cfg, std::mt19937 &rng)
{
    ball.x = cfg.board_width / 2.0;
    ball.y = cfg.board_height / 2.0;
    ball.dx = random_sign(rng) * cfg.ball_speed;
    ball.dy = random_sign(rng) * cfg.ball_speed;
}

game::GameState make_initial_state(const game::GameConfig &cfg, std::mt19937 &rng)
{
    game::GameState st;
    reset_ball(st.ball, cfg, rng);
    double centred = clamp_paddle(cfg.board_height / 2.0 - cfg.paddle_height / 2.0, cfg);
    st.left.y = centred;
    st.right.y = centred;
    return st;
}

StepOutcome advance(game::GameState &state, const game::GameConfig &cfg, std::mt19937 &rng)
{
    auto &ball = state.ball;
    ball.x += ball.dx;
    ball.y += ball.dy;

    // Reflection without clamping: the ball may overlap a wall for up to one tick.
    if (ball.y <= 0.0 || ball.y >= cfg.board_height - cfg.ball_size)
        ball.dy = -ball.dy;

    if (ball.x <= cfg.paddle_width && within_paddle(ball, state.left, cfg)) {
        ball.dx = std::fabs(ball.dx);
        ball.dy = deflect_dy(ball, state.left, cfg);
    }
    if (ball.x >= cfg.board_width - cfg.paddle_width - cfg.ball_size && within_paddle(ball, state.right, cfg)) {
        ball.dx = -std::fabs(ball.dx);
        ball.dy = deflect_dy(ball, state.right, cfg);
    }

    if (ball.x < 0.0) {
        ++state.score_right;
        reset_ball(ball, cfg, rng);
        return StepOutcome::right_scored;
    }
    if (ball.x > cfg.board_width) {
        ++state.score_left;
        reset_ball(ball, cfg, rng);
        return StepOutcome::left_scored;
    }
    return StepOutcome::none;
}

} // namespace pongd::phys
