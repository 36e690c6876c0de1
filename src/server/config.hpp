// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/game_state.hpp"
#include "server/lobby/session_coordinator.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pongd {

struct ServerConfig
{
    uint16_t listen_port{40101};
    game::GameConfig game{};
    lobby::RoomPolicy room_policy{lobby::RoomPolicy::fixed};
    std::string default_room{"room1"};
    uint32_t heartbeat_timeout_seconds{15};
    uint32_t max_outbound_queue{256};
    uint16_t metrics_port{0}; // 0 disables
    std::string log_level{"info"};
    bool log_json{false};
    uint32_t fixed_seed{0}; // 0 = random per room
};

// Keys absent from the file keep their defaults. Throws YAML::Exception on
// unreadable or mistyped input and std::invalid_argument on values that fail
// validation.
ServerConfig load_config(const std::string &path);
ServerConfig parse_config(const std::string &yaml_text);
void validate_config(const ServerConfig &cfg);

// TCP port from a command-line argument; std::nullopt unless it is a whole
// number in 1..65535.
std::optional<uint16_t> parse_port(const std::string &text);

} // namespace pongd
