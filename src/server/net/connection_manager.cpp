// SPDX-License-Identifier: Apache-2.0
#include "server/net/connection_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace pongd::net {

std::shared_ptr<Connection> ConnectionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto c = std::make_shared<Connection>(cid, std::move(client));
    c->last_heartbeat = std::chrono::steady_clock::now();
    m_by_id.emplace(cid, c);
    pongd::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
    return c;
}

std::shared_ptr<Connection> ConnectionManager::add_detached()
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "local_" + std::to_string(++m_connection_counter);
    auto c = std::make_shared<Connection>(cid);
    c->last_heartbeat = std::chrono::steady_clock::now();
    m_by_id.emplace(cid, c);
    pongd::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
    return c;
}

std::shared_ptr<Connection> ConnectionManager::find(const std::string &connection_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_id.find(connection_id);
    return it == m_by_id.end() ? nullptr : it->second;
}

void ConnectionManager::push_locked(Connection &c, const pongd::ServerMessage &msg)
{
    if (c.outgoing.size() >= m_max_outbound) {
        c.outgoing.pop_front();
        pongd::metrics::runtime().messages_dropped_backlog.fetch_add(1, std::memory_order_relaxed);
    }
    c.outgoing.push_back(msg);
}

bool ConnectionManager::push_message(const std::string &connection_id, const pongd::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_id.find(connection_id);
    if (it == m_by_id.end() || it->second->closed)
        return false;
    push_locked(*it->second, msg);
    return true;
}

void ConnectionManager::push_message(const std::shared_ptr<Connection> &c, const pongd::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (c->closed)
        return;
    push_locked(*c, msg);
}

std::vector<pongd::ServerMessage> ConnectionManager::drain_messages(const std::shared_ptr<Connection> &c)
{
    std::scoped_lock lk{m_mutex};
    std::vector<pongd::ServerMessage> out;
    out.reserve(c->outgoing.size());
    for (auto &m : c->outgoing)
        out.push_back(std::move(m));
    c->outgoing.clear();
    return out;
}

void ConnectionManager::update_heartbeat(const std::shared_ptr<Connection> &c)
{
    std::scoped_lock lk{m_mutex};
    c->last_heartbeat = std::chrono::steady_clock::now();
}

bool ConnectionManager::is_closed(const std::shared_ptr<Connection> &c)
{
    std::scoped_lock lk{m_mutex};
    return c->closed;
}

std::vector<std::shared_ptr<Connection>> ConnectionManager::snapshot_all()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Connection>> res;
    res.reserve(m_by_id.size());
    for (auto &kv : m_by_id)
        res.push_back(kv.second);
    return res;
}

std::vector<std::shared_ptr<Connection>> ConnectionManager::snapshot_stale(
    std::chrono::steady_clock::duration max_idle, std::chrono::steady_clock::time_point now)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Connection>> res;
    for (auto &kv : m_by_id) {
        if (now - kv.second->last_heartbeat > max_idle)
            res.push_back(kv.second);
    }
    return res;
}

bool ConnectionManager::remove(const std::shared_ptr<Connection> &c)
{
    std::scoped_lock lk{m_mutex};
    if (c->closed)
        return false;
    c->closed = true;
    c->outgoing.clear();
    m_by_id.erase(c->connection_id);
    pongd::metrics::gauge_dec(pongd::metrics::runtime().connected_players);
    pongd::log::debug("[conn] removed id={} remaining={}", c->connection_id, m_by_id.size());
    return true;
}

size_t ConnectionManager::size()
{
    std::scoped_lock lk{m_mutex};
    return m_by_id.size();
}

} // namespace pongd::net
