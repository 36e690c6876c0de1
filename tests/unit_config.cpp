// SPDX-License-Identifier: Apache-2.0
// YAML config loading: defaults, overrides, validation failures.
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#ifndef PONGD_SOURCE_DIR
#    define PONGD_SOURCE_DIR "."
#endif

template <typename Ex>
static bool throws(const std::string &yaml)
{
    try {
        pongd::parse_config(yaml);
    } catch (const Ex &) {
        return true;
    }
    return false;
}

int main()
{
    // Empty document keeps every default.
    {
        auto cfg = pongd::parse_config("");
        assert(cfg.listen_port == 40101);
        assert(cfg.game.tick_rate == 60);
        assert(cfg.game.board_width == 800.0 && cfg.game.board_height == 400.0);
        assert(cfg.game.paddle_height == 80.0 && cfg.game.paddle_step == 5.0);
        assert(cfg.room_policy == pongd::lobby::RoomPolicy::fixed);
        assert(cfg.default_room == "room1");
        assert(cfg.metrics_port == 0);
        assert(cfg.fixed_seed == 0);
    }

    // Partial override.
    {
        auto cfg = pongd::parse_config("tick_rate: 30\nroom_policy: first_open\nlog_json: true\n");
        assert(cfg.game.tick_rate == 30);
        assert(cfg.room_policy == pongd::lobby::RoomPolicy::first_open);
        assert(cfg.log_json);
        assert(cfg.listen_port == 40101);
    }

    // Test profile file.
    {
        auto cfg = pongd::load_config(std::string(PONGD_SOURCE_DIR) + "/tests/config/server_test.yaml");
        assert(cfg.listen_port == 41101);
        assert(cfg.log_level == "debug");
        assert(cfg.game.tick_rate == 120);
        assert(cfg.game.board_width == 200.0 && cfg.game.board_height == 100.0);
        assert(cfg.game.paddle_height == 20.0 && cfg.game.paddle_step == 7.0);
        assert(cfg.room_policy == pongd::lobby::RoomPolicy::first_open);
        assert(cfg.default_room == "lobby");
        assert(cfg.heartbeat_timeout_seconds == 3);
        assert(cfg.max_outbound_queue == 64);
        assert(cfg.fixed_seed == 1234);
    }

    // Shipped production profile parses.
    {
        auto cfg = pongd::load_config(std::string(PONGD_SOURCE_DIR) + "/config/server.yaml");
        assert(cfg.game.tick_rate == 60);
    }

    // Validation and type errors.
    assert(throws<std::invalid_argument>("room_policy: lottery\n"));
    assert(throws<std::invalid_argument>("tick_rate: 0\n"));
    assert(throws<std::invalid_argument>("board_height: 50\npaddle_height: 80\n"));
    assert(throws<std::invalid_argument>("default_room: ''\n"));
    assert(throws<std::invalid_argument>("board_width: .nan\n"));
    assert(throws<std::invalid_argument>("board_height: .inf\n"));
    assert(throws<std::invalid_argument>("paddle_height: .nan\n"));
    assert(throws<std::invalid_argument>("ball_speed: .nan\n"));
    assert(throws<std::invalid_argument>("paddle_step: .nan\n"));
    assert(throws<std::invalid_argument>("board_height: 100\npaddle_height: 20\nball_size: 100\n"));
    assert(throws<std::invalid_argument>("paddle_width: 400\n"));
    // Largest ball that still fits is accepted.
    assert(pongd::parse_config("board_height: 100\npaddle_height: 20\nball_size: 99\n").game.ball_size == 99.0);
    assert(throws<std::invalid_argument>("max_outbound_queue: 0\n"));
    assert(throws<std::invalid_argument>("- just\n- a list\n"));
    assert(throws<YAML::Exception>("tick_rate: fast\n"));
    assert(throws<YAML::Exception>("listen_port: [1, 2\n"));
    {
        bool missing = false;
        try {
            pongd::load_config("/nonexistent/pongd.yaml");
        } catch (const YAML::BadFile &) {
            missing = true;
        }
        assert(missing);
    }

    // Command-line ports: no silent wrap-around.
    assert(pongd::parse_port("40101") == std::optional<uint16_t>(40101));
    assert(pongd::parse_port("65535") == std::optional<uint16_t>(65535));
    assert(!pongd::parse_port("70000"));
    assert(!pongd::parse_port("0"));
    assert(!pongd::parse_port("-1"));
    assert(!pongd::parse_port("80x"));
    assert(!pongd::parse_port(""));
    assert(!pongd::parse_port("99999999999999999999"));

    std::cout << "unit_config OK" << std::endl;
    return 0;
}
