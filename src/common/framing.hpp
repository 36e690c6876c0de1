// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload length, then payload.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace pongd::netutil {

inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline void append_frame(std::string &out, std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

enum class extract_status
{
    need_more,
    frame,
    invalid
};

struct FrameParseState
{
    std::vector<char> buffer; // bytes received but not yet consumed
    uint32_t expected_len{0};
    bool have_len{false};

    void feed(const char *data, size_t n) { buffer.insert(buffer.end(), data, data + n); }
};

// Extracts at most one payload into out. A zero length is a valid empty
// payload (a protobuf message with no fields set). A length above the cap
// poisons the stream; the caller is expected to drop the connection.
inline extract_status try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return extract_status::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len > kMaxFrameBytes)
            return extract_status::invalid;
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return extract_status::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return extract_status::frame;
}

} // namespace pongd::netutil
