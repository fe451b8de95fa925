// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload length followed by the payload bytes.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace pong::netutil {

inline constexpr uint32_t kMaxFrameBytes = 1u << 20;

inline std::string build_frame(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net = htonl(len);
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};

    void append(std::span<const char> bytes) { buffer.insert(buffer.end(), bytes.begin(), bytes.end()); }
};

enum class ExtractResult
{
    need_more,
    frame,
    invalid
};

// Extract one payload into out. `invalid` means the stream can no longer be trusted
// (zero or oversized length) and the connection should be dropped.
inline ExtractResult try_extract(FrameParseState &st, std::string &out)
{
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return ExtractResult::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        st.have_len = true;
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes)
            return ExtractResult::invalid;
    }
    if (st.buffer.size() < 4 + st.expected_len)
        return ExtractResult::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return ExtractResult::frame;
}

} // namespace pong::netutil
