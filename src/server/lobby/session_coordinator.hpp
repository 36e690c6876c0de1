// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pongd.pb.h"
#include "server/game/game_state.hpp"
#include "server/lobby/room_registry.hpp"

#include <optional>
#include <string>

namespace pongd::lobby {

enum class RoomPolicy
{
    fixed, // every join targets default_room
    first_open // first room with a free paddle slot, else a new one
};

// Throws std::invalid_argument for unknown names.
RoomPolicy parse_room_policy(const std::string &name);
const char *room_policy_name(RoomPolicy p);

struct CoordinatorConfig
{
    RoomPolicy policy{RoomPolicy::fixed};
    std::string default_room{"room1"};
};

// Per-connection entry points. Holds no room references between calls: each
// operation re-resolves the room through the registry, since the room may have
// been destroyed by a concurrent disconnect.
class SessionCoordinator
{
public:
    SessionCoordinator(RoomRegistry &registry, CoordinatorConfig cfg)
        : m_registry(registry), m_cfg(std::move(cfg))
    {}

    // std::nullopt when the connection already joined.
    std::optional<JoinResult> join(const std::string &connection_id);
    // Returns false when the connection owns no paddle.
    bool move_paddle(const std::string &connection_id, game::Direction dir);
    // Idempotent; false for a connection that is not in any room.
    bool disconnect(const std::string &connection_id);

    // Dispatches a decoded inbound message. Messages the coordinator does not
    // own (heartbeats) are ignored here.
    void handle(const std::string &connection_id, const pongd::ClientMessage &msg);

    const CoordinatorConfig &config() const { return m_cfg; }

private:
    RoomRegistry &m_registry;
    CoordinatorConfig m_cfg;
};

} // namespace pongd::lobby
