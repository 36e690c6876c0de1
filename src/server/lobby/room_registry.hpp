// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/game_state.hpp"
#include "server/game/room.hpp"
#include "server/net/broadcast_gateway.hpp"

#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pongd::lobby {

struct JoinResult
{
    std::string room_id;
    std::optional<game::Side> side; // empty for a spectator
    bool started{false};
};

// Owns room existence and the connection -> room reverse index.
// Lock order is always registry, then room. Ticks and paddle moves only take
// the room lock, so rooms never contend with each other.
class RoomRegistry
{
public:
    // fixed_seed > 0 seeds every room identically (tests); 0 draws a seed per room.
    RoomRegistry(
        game::GameConfig cfg,
        pongd::net::BroadcastGateway &gateway,
        std::shared_ptr<coro::io_scheduler> scheduler,
        uint32_t fixed_seed = 0);
    ~RoomRegistry();

    RoomRegistry(const RoomRegistry &) = delete;
    RoomRegistry &operator=(const RoomRegistry &) = delete;

    // Joins (creating if needed) the given room. std::nullopt when the
    // connection is already a member of some room.
    std::optional<JoinResult> join(const std::string &connection_id, const std::string &room_id);
    // Joins the first room with a free paddle slot, creating "room_<n>" if none.
    std::optional<JoinResult> join_first_open(const std::string &connection_id);
    // Returns false for an unknown connection.
    bool leave(const std::string &connection_id);

    std::shared_ptr<game::Room> find(const std::string &room_id) const;
    std::shared_ptr<game::Room> room_of(const std::string &connection_id) const;
    std::optional<std::string> room_id_of(const std::string &connection_id) const;
    size_t room_count() const;
    std::vector<std::string> room_ids() const;
    // Stops every tick loop; rooms stay registered.
    void shutdown();

private:
    JoinResult join_locked(const std::string &connection_id, const std::string &room_id);
    uint32_t next_seed();

    const game::GameConfig m_cfg;
    pongd::net::BroadcastGateway &m_gateway;
    std::shared_ptr<coro::io_scheduler> m_scheduler;
    const uint32_t m_fixed_seed;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<game::Room>> m_rooms;
    std::vector<std::string> m_creation_order; // stable scan order for join_first_open
    std::unordered_map<std::string, std::string> m_room_by_connection;
    uint64_t m_room_counter{0};
};

} // namespace pongd::lobby
