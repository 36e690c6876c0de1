// SPDX-License-Identifier: Apache-2.0
// game_state.hpp - Authoritative per-room state and the shared board geometry.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pongd::game {

enum class Side
{
    left,
    right
};

enum class Direction
{
    up,
    down
};

inline const char *side_name(Side s)
{
    return s == Side::left ? "left" : "right";
}

// Board geometry and simulation constants. Clients derive their drawing
// geometry from the same values, so they are configured in one place.
struct GameConfig
{
    double board_width{800.0};
    double board_height{400.0};
    double paddle_width{10.0};
    double paddle_height{80.0};
    double ball_size{10.0};
    double paddle_step{5.0};
    double ball_speed{4.0};
    uint32_t tick_rate{60};
};

struct Ball
{
    double x{0.0};
    double y{0.0};
    double dx{0.0};
    double dy{0.0};
};

struct PaddleSlot
{
    double y{0.0}; // top edge offset
    std::optional<std::string> owner; // connection id, empty when unowned
};

struct GameState
{
    Ball ball;
    PaddleSlot left;
    PaddleSlot right;
    uint32_t score_left{0};
    uint32_t score_right{0};
    bool active{false};
    std::vector<std::string> players; // join order
    uint64_t server_tick{0};

    PaddleSlot &paddle(Side s) { return s == Side::left ? left : right; }
    const PaddleSlot &paddle(Side s) const { return s == Side::left ? left : right; }

    // Side owned by the given connection, if any.
    std::optional<Side> side_of(const std::string &connection_id) const
    {
        if (left.owner && *left.owner == connection_id)
            return Side::left;
        if (right.owner && *right.owner == connection_id)
            return Side::right;
        return std::nullopt;
    }

    bool both_slots_owned() const { return left.owner.has_value() && right.owner.has_value(); }
};

} // namespace pongd::game
