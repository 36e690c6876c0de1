// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>

namespace pongd {

template <typename T>
static void read_key(const YAML::Node &root, const char *key, T &dst)
{
    if (root[key])
        dst = root[key].as<T>();
}

static ServerConfig from_node(const YAML::Node &root)
{
    ServerConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw std::invalid_argument("config root must be a mapping");
    read_key(root, "listen_port", cfg.listen_port);
    read_key(root, "tick_rate", cfg.game.tick_rate);
    read_key(root, "board_width", cfg.game.board_width);
    read_key(root, "board_height", cfg.game.board_height);
    read_key(root, "paddle_width", cfg.game.paddle_width);
    read_key(root, "paddle_height", cfg.game.paddle_height);
    read_key(root, "ball_size", cfg.game.ball_size);
    read_key(root, "paddle_step", cfg.game.paddle_step);
    read_key(root, "ball_speed", cfg.game.ball_speed);
    if (root["room_policy"])
        cfg.room_policy = lobby::parse_room_policy(root["room_policy"].as<std::string>());
    read_key(root, "default_room", cfg.default_room);
    read_key(root, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
    read_key(root, "max_outbound_queue", cfg.max_outbound_queue);
    read_key(root, "metrics_port", cfg.metrics_port);
    read_key(root, "log_level", cfg.log_level);
    read_key(root, "log_json", cfg.log_json);
    read_key(root, "fixed_seed", cfg.fixed_seed);
    validate_config(cfg);
    return cfg;
}

ServerConfig load_config(const std::string &path)
{
    return from_node(YAML::LoadFile(path));
}

ServerConfig parse_config(const std::string &yaml_text)
{
    return from_node(YAML::Load(yaml_text));
}

std::optional<uint16_t> parse_port(const std::string &text)
{
    size_t used = 0;
    long v = 0;
    try {
        v = std::stol(text, &used);
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
    if (used != text.size() || v < 1 || v > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(v);
}

void validate_config(const ServerConfig &cfg)
{
    const auto &g = cfg.game;
    if (g.tick_rate == 0 || g.tick_rate > 1000)
        throw std::invalid_argument("tick_rate must be in 1..1000");
    // Written as !(x > 0) so NaN fails too.
    if (!(g.board_width > 0) || !(g.board_height > 0) || std::isinf(g.board_width) || std::isinf(g.board_height))
        throw std::invalid_argument("board dimensions must be positive and finite");
    if (!(g.paddle_width > 0) || !(g.paddle_height > 0) || !(g.paddle_height <= g.board_height))
        throw std::invalid_argument("paddle must be positive and fit the board height");
    if (!(g.paddle_width < g.board_width / 2))
        throw std::invalid_argument("paddle_width must be less than half the board width");
    if (!(g.ball_size > 0) || !(g.ball_speed > 0) || !(g.paddle_step > 0))
        throw std::invalid_argument("ball_size, ball_speed and paddle_step must be positive");
    if (!(g.ball_size < g.board_height) || !(g.ball_size < g.board_width))
        throw std::invalid_argument("ball_size must be smaller than the board");
    if (std::isinf(g.ball_speed) || std::isinf(g.paddle_step))
        throw std::invalid_argument("ball_speed and paddle_step must be finite");
    if (cfg.default_room.empty())
        throw std::invalid_argument("default_room must not be empty");
    if (cfg.max_outbound_queue == 0)
        throw std::invalid_argument("max_outbound_queue must be positive");
}

} // namespace pongd
