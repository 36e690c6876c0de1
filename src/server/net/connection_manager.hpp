// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pongd.pb.h"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pongd::net {

struct Connection : public std::enable_shared_from_this<Connection>
{
    std::string connection_id;
    bool closed{false}; // set once removed; the socket loop exits on its next pass
    std::chrono::steady_clock::time_point last_heartbeat{};
    std::unique_ptr<coro::net::tcp::client> client; // nullptr for in-process connections
    std::deque<pongd::ServerMessage> outgoing; // pending outbound messages

    Connection(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Connection(std::string cid)
        : connection_id(std::move(cid))
    {}
};

// Table of live transport connections and their outbound queues. Every method
// is safe to call from any scheduler thread.
class ConnectionManager
{
public:
    explicit ConnectionManager(size_t max_outbound_queue = 256)
        : m_max_outbound(max_outbound_queue == 0 ? 1 : max_outbound_queue)
    {}

    std::shared_ptr<Connection> add_connection(coro::net::tcp::client client);
    // Connection without a socket (tests, in-process tools).
    std::shared_ptr<Connection> add_detached();
    std::shared_ptr<Connection> find(const std::string &connection_id);
    // Queues msg; the oldest entry is dropped when the queue is full. Returns
    // false when the connection is unknown or already closed.
    bool push_message(const std::string &connection_id, const pongd::ServerMessage &msg);
    void push_message(const std::shared_ptr<Connection> &c, const pongd::ServerMessage &msg);
    std::vector<pongd::ServerMessage> drain_messages(const std::shared_ptr<Connection> &c);
    void update_heartbeat(const std::shared_ptr<Connection> &c);
    bool is_closed(const std::shared_ptr<Connection> &c);
    std::vector<std::shared_ptr<Connection>> snapshot_all();
    // Connections whose last heartbeat is older than max_idle at now.
    std::vector<std::shared_ptr<Connection>> snapshot_stale(
        std::chrono::steady_clock::duration max_idle, std::chrono::steady_clock::time_point now);
    // Returns false if the connection was already removed.
    bool remove(const std::shared_ptr<Connection> &c);
    size_t size();

private:
    void push_locked(Connection &c, const pongd::ServerMessage &msg);

    std::mutex m_mutex;
    size_t m_max_outbound;
    uint64_t m_connection_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Connection>> m_by_id;
};

} // namespace pongd::net
