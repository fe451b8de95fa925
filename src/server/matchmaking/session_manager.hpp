// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pong.pb.h"
#include "server/game/rate_limiter.hpp"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pong::mm {

// One network peer. Outlives its socket: a match keeps the handle until the player reconnects
// on a new connection, so delivery to a closed peer is dropped rather than treated as an error.
struct Session : public std::enable_shared_from_this<Session>
{
    std::string connection_id; // internal id assigned on accept
    std::string player_id; // set after auth
    std::string display_name;
    std::optional<std::string> skin;
    bool authenticated{false};
    bool in_queue{false};
    bool closed{false};
    std::string queue_tier;
    std::chrono::steady_clock::time_point queue_join_time{};
    std::chrono::steady_clock::time_point last_heartbeat{}; // updated on heartbeat
    // Chat is limited per connection before it reaches the match.
    pong::game::MinIntervalLimiter chat_limiter{std::chrono::seconds(1)};

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for in-process peers (tests, tools)
    std::vector<pong::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    Session() = default;
};

class SessionManager
{
public:
    explicit SessionManager(std::chrono::milliseconds chat_min_interval = std::chrono::seconds(1))
        : m_chat_min_interval(chat_min_interval)
    {}

    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Registers a peer without a socket (tests, in-process tools).
    std::shared_ptr<Session> add_detached(std::string connection_id);
    void authenticate(
        const std::shared_ptr<Session> &s,
        std::string player_id,
        std::string display_name,
        std::optional<std::string> skin);
    bool enqueue(const std::shared_ptr<Session> &s, std::string tier);
    bool leave_queue(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_queue();
    void pop_from_queue(const std::vector<std::shared_ptr<Session>> &sessions);
    void push_message(const std::shared_ptr<Session> &s, const pong::ServerMessage &msg);
    std::vector<pong::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);
    void update_heartbeat(const std::shared_ptr<Session> &s);
    bool allow_chat(const std::shared_ptr<Session> &s, std::chrono::steady_clock::time_point now);
    std::shared_ptr<Session> find_by_player(const std::string &player_id);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    // Marks the peer closed and forgets it. Returns false when it was already closed.
    bool disconnect_session(const std::shared_ptr<Session> &s);
    bool is_closed(const std::shared_ptr<Session> &s);
    size_t queue_size();

private:
    std::mutex m_mutex;
    std::chrono::milliseconds m_chat_min_interval;
    uint64_t m_connection_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection; // every live peer
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_player; // post-auth, latest connection
    std::vector<std::shared_ptr<Session>> m_queue; // FIFO across tiers, join order
};

} // namespace pong::mm
