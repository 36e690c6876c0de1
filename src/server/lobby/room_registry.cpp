// SPDX-License-Identifier: Apache-2.0
#include "server/lobby/room_registry.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <random>

namespace pongd::lobby {

RoomRegistry::RoomRegistry(
    game::GameConfig cfg,
    pongd::net::BroadcastGateway &gateway,
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint32_t fixed_seed)
    : m_cfg(cfg), m_gateway(gateway), m_scheduler(std::move(scheduler)), m_fixed_seed(fixed_seed)
{}

RoomRegistry::~RoomRegistry()
{
    shutdown();
}

uint32_t RoomRegistry::next_seed()
{
    if (m_fixed_seed > 0)
        return m_fixed_seed;
    static std::mt19937 rng(std::random_device{}());
    return rng();
}

JoinResult RoomRegistry::join_locked(const std::string &connection_id, const std::string &room_id)
{
    auto it = m_rooms.find(room_id);
    if (it == m_rooms.end()) {
        auto room = std::make_shared<game::Room>(room_id, m_cfg, m_gateway, m_scheduler, next_seed());
        it = m_rooms.emplace(room_id, std::move(room)).first;
        m_creation_order.push_back(room_id);
        auto &rt = pongd::metrics::runtime();
        rt.rooms_created.fetch_add(1, std::memory_order_relaxed);
        rt.active_rooms.fetch_add(1, std::memory_order_relaxed);
        pongd::log::info("[registry] room created id={} rooms={}", room_id, m_rooms.size());
    }
    auto outcome = it->second->add_player(connection_id);
    m_room_by_connection[connection_id] = room_id;
    return JoinResult{room_id, outcome.side, outcome.started};
}

std::optional<JoinResult> RoomRegistry::join(const std::string &connection_id, const std::string &room_id)
{
    std::scoped_lock lk{m_mutex};
    if (m_room_by_connection.count(connection_id))
        return std::nullopt;
    return join_locked(connection_id, room_id);
}

std::optional<JoinResult> RoomRegistry::join_first_open(const std::string &connection_id)
{
    std::scoped_lock lk{m_mutex};
    if (m_room_by_connection.count(connection_id))
        return std::nullopt;
    for (auto &id : m_creation_order) {
        auto it = m_rooms.find(id);
        if (it != m_rooms.end() && it->second->has_open_slot())
            return join_locked(connection_id, id);
    }
    std::string id;
    do {
        id = "room_" + std::to_string(++m_room_counter);
    } while (m_rooms.count(id));
    return join_locked(connection_id, id);
}

bool RoomRegistry::leave(const std::string &connection_id)
{
    std::scoped_lock lk{m_mutex};
    auto idx = m_room_by_connection.find(connection_id);
    if (idx == m_room_by_connection.end())
        return false;
    std::string room_id = idx->second;
    m_room_by_connection.erase(idx);
    auto it = m_rooms.find(room_id);
    if (it == m_rooms.end())
        return true;
    auto outcome = it->second->remove_player(connection_id);
    if (outcome.empty) {
        m_rooms.erase(it);
        m_creation_order.erase(
            std::remove(m_creation_order.begin(), m_creation_order.end(), room_id), m_creation_order.end());
        auto &rt = pongd::metrics::runtime();
        rt.rooms_destroyed.fetch_add(1, std::memory_order_relaxed);
        pongd::metrics::gauge_dec(rt.active_rooms);
        pongd::log::info("[registry] room destroyed id={} rooms={}", room_id, m_rooms.size());
    }
    return true;
}

std::shared_ptr<game::Room> RoomRegistry::find(const std::string &room_id) const
{
    std::scoped_lock lk{m_mutex};
    auto it = m_rooms.find(room_id);
    return it == m_rooms.end() ? nullptr : it->second;
}

std::shared_ptr<game::Room> RoomRegistry::room_of(const std::string &connection_id) const
{
    std::scoped_lock lk{m_mutex};
    auto idx = m_room_by_connection.find(connection_id);
    if (idx == m_room_by_connection.end())
        return nullptr;
    auto it = m_rooms.find(idx->second);
    return it == m_rooms.end() ? nullptr : it->second;
}

std::optional<std::string> RoomRegistry::room_id_of(const std::string &connection_id) const
{
    std::scoped_lock lk{m_mutex};
    auto idx = m_room_by_connection.find(connection_id);
    if (idx == m_room_by_connection.end())
        return std::nullopt;
    return idx->second;
}

size_t RoomRegistry::room_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_rooms.size();
}

std::vector<std::string> RoomRegistry::room_ids() const
{
    std::scoped_lock lk{m_mutex};
    return m_creation_order;
}

void RoomRegistry::shutdown()
{
    std::scoped_lock lk{m_mutex};
    for (auto &kv : m_rooms)
        kv.second->shutdown();
}

} // namespace pongd::lobby
