// SPDX-License-Identifier: Apache-2.0
#include "server/lobby/session_coordinator.hpp"

#include "common/logger.hpp"
#include "server/game/messages.hpp"

#include <stdexcept>

namespace pongd::lobby {

RoomPolicy parse_room_policy(const std::string &name)
{
    if (name == "fixed")
        return RoomPolicy::fixed;
    if (name == "first_open")
        return RoomPolicy::first_open;
    throw std::invalid_argument("unknown room_policy '" + name + "' (expected fixed|first_open)");
}

const char *room_policy_name(RoomPolicy p)
{
    return p == RoomPolicy::fixed ? "fixed" : "first_open";
}

std::optional<JoinResult> SessionCoordinator::join(const std::string &connection_id)
{
    auto res = m_cfg.policy == RoomPolicy::first_open ? m_registry.join_first_open(connection_id)
                                                      : m_registry.join(connection_id, m_cfg.default_room);
    if (!res)
        pongd::log::debug("[coord] duplicate join ignored conn={}", connection_id);
    return res;
}

bool SessionCoordinator::move_paddle(const std::string &connection_id, game::Direction dir)
{
    auto room = m_registry.room_of(connection_id);
    if (!room)
        return false;
    return room->move_paddle(connection_id, dir);
}

bool SessionCoordinator::disconnect(const std::string &connection_id)
{
    return m_registry.leave(connection_id);
}

void SessionCoordinator::handle(const std::string &connection_id, const pongd::ClientMessage &msg)
{
    switch (msg.payload_case()) {
        case pongd::ClientMessage::kJoin:
            join(connection_id);
            break;
        case pongd::ClientMessage::kMovePaddle: {
            auto dir = game::from_proto(msg.move_paddle().direction());
            if (!dir) {
                pongd::log::debug("[coord] move without direction conn={}", connection_id);
                break;
            }
            move_paddle(connection_id, *dir);
            break;
        }
        default:
            break;
    }
}

} // namespace pongd::lobby
