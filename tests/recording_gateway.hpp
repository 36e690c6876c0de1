// SPDX-License-Identifier: Apache-2.0
// recording_gateway.hpp - In-memory BroadcastGateway for room/registry tests.
#pragma once
#include "server/net/broadcast_gateway.hpp"

#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pongd::test {

class RecordingGateway : public pongd::net::BroadcastGateway
{
public:
    bool deliver(const std::string &connection_id, const pongd::ServerMessage &msg) override
    {
        std::scoped_lock lk{m_mutex};
        if (m_unreachable.count(connection_id))
            return false;
        m_sent.emplace_back(connection_id, msg);
        return true;
    }

    // Appends an empty message to the connection's stream so a reader can
    // tell which messages arrived before and after a test-side event.
    void mark(const std::string &connection_id)
    {
        std::scoped_lock lk{m_mutex};
        m_sent.emplace_back(connection_id, pongd::ServerMessage{});
    }

    void set_unreachable(const std::string &connection_id)
    {
        std::scoped_lock lk{m_mutex};
        m_unreachable.insert(connection_id);
    }

    std::vector<pongd::ServerMessage> messages_for(const std::string &connection_id)
    {
        std::scoped_lock lk{m_mutex};
        std::vector<pongd::ServerMessage> out;
        for (auto &[cid, m] : m_sent)
            if (cid == connection_id)
                out.push_back(m);
        return out;
    }

    size_t count(const std::string &connection_id, pongd::ServerMessage::PayloadCase kind)
    {
        std::scoped_lock lk{m_mutex};
        size_t n = 0;
        for (auto &[cid, m] : m_sent)
            if (cid == connection_id && m.payload_case() == kind)
                ++n;
        return n;
    }

    size_t total()
    {
        std::scoped_lock lk{m_mutex};
        return m_sent.size();
    }

    void clear()
    {
        std::scoped_lock lk{m_mutex};
        m_sent.clear();
    }

private:
    std::mutex m_mutex;
    std::vector<std::pair<std::string, pongd::ServerMessage>> m_sent;
    std::set<std::string> m_unreachable;
};

} // namespace pongd::test
