// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "pong.pb.h"
#include "server/shutdown.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace pong::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<pong::mm::Session> session,
    std::chrono::milliseconds poll_timeout,
    ListenerDeps deps);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_rate, ListenerDeps deps)
{
    co_await scheduler->schedule();
    // Half a tick, bounded to [5ms, 50ms].
    auto poll_timeout = std::chrono::milliseconds(std::clamp<uint32_t>(500 / std::max<uint32_t>(tick_rate, 1), 5, 50));
    pong::log::info("[listener] TCP listener on port {} (poll {}ms)", port, poll_timeout.count());
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!pong::g_shutdown.load()) {
        auto status = co_await server.poll(std::chrono::milliseconds(500));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = deps.sessions->add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session, poll_timeout, deps));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            pong::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

static coro::task<void> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return; // peer gone; the read side reports the close
    }
}

static uint64_t now_ms()
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

// Handles one decoded client message; replies are queued on the session.
static void dispatch(const std::shared_ptr<pong::mm::Session> &session, const pong::ClientMessage &cmsg, ListenerDeps &deps)
{
    auto &sessions = *deps.sessions;
    auto &presence = *deps.presence;
    switch (cmsg.payload_case()) {
        case pong::ClientMessage::kAuthRequest: {
            const auto &ar = cmsg.auth_request();
            auto res = deps.auth->validate(ar.token());
            pong::ServerMessage smsg;
            auto *resp = smsg.mutable_auth_response();
            resp->set_success(res.ok);
            if (!res.ok) {
                resp->set_reason(res.reason);
                sessions.push_message(session, smsg);
                pong::metrics::runtime().auth_failures.fetch_add(1, std::memory_order_relaxed);
                pong::log::warn("[conn] {} auth failed: {}", session->connection_id, res.reason);
                return;
            }
            std::optional<std::string> skin;
            if (!ar.skin().empty())
                skin = ar.skin();
            sessions.authenticate(session, res.user_id, ar.display_name(), std::move(skin));
            resp->set_player_id(res.user_id);
            sessions.push_message(session, smsg);
            pong::log::info("[conn] {} authenticated player={} client={}", session->connection_id, res.user_id, ar.client_version());
            presence.bind(session);
            return;
        }
        case pong::ClientMessage::kQueueJoin: {
            if (!session->authenticated)
                return;
            const auto &tier = cmsg.queue_join().tier();
            pong::ServerMessage smsg;
            auto *qs = smsg.mutable_queue_status();
            qs->set_tier(tier);
            if (!deps.matchmaker->has_tier(tier) || presence.in_live_match(session->player_id)
                || !sessions.enqueue(session, tier)) {
                qs->set_left(true);
                pong::log::debug("[conn] {} queue join rejected tier={}", session->player_id, tier);
            } else {
                auto queued = sessions.snapshot_queue();
                uint32_t in_tier = 0;
                uint32_t position = 0;
                for (const auto &q : queued) {
                    if (q->queue_tier != tier)
                        continue;
                    ++in_tier;
                    if (q == session)
                        position = in_tier;
                }
                qs->set_position(position);
                qs->set_players_in_queue(in_tier);
            }
            sessions.push_message(session, smsg);
            return;
        }
        case pong::ClientMessage::kQueueLeave: {
            if (!sessions.leave_queue(session))
                return;
            pong::ServerMessage smsg;
            smsg.mutable_queue_status()->set_tier(session->queue_tier);
            smsg.mutable_queue_status()->set_left(true);
            sessions.push_message(session, smsg);
            return;
        }
        case pong::ClientMessage::kReady:
            presence.ready(session, cmsg.ready().match_id());
            return;
        case pong::ClientMessage::kInput:
            presence.input(session, cmsg.input().match_id(), cmsg.input().direction());
            return;
        case pong::ClientMessage::kChat:
            presence.chat(session, cmsg.chat().match_id(), cmsg.chat().text(), std::chrono::steady_clock::now());
            return;
        case pong::ClientMessage::kHeartbeat: {
            sessions.update_heartbeat(session);
            uint64_t server_ms = now_ms();
            uint64_t client_ms = cmsg.heartbeat().time_ms();
            pong::ServerMessage hb;
            auto *hbr = hb.mutable_heartbeat_resp();
            hbr->set_client_time_ms(client_ms);
            hbr->set_server_time_ms(server_ms);
            hbr->set_delta_ms(server_ms > client_ms ? server_ms - client_ms : 0);
            sessions.push_message(session, hb);
            return;
        }
        case pong::ClientMessage::PAYLOAD_NOT_SET:
            return;
    }
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<pong::mm::Session> session,
    std::chrono::milliseconds poll_timeout,
    ListenerDeps deps)
{
    co_await scheduler->schedule();
    pong::log::debug("[conn] new connection id={}", session->connection_id);
    pong::netutil::FrameParseState fps;
    std::string cause = "shutdown";
    while (!pong::g_shutdown.load()) {
        auto pending = deps.sessions->drain_messages(session);
        if (!pending.empty()) {
            std::string batch;
            for (auto &msg : pending) {
                std::string out;
                if (!msg.SerializeToString(&out))
                    continue;
                batch += pong::netutil::build_frame(out);
            }
            co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()));
        }
        if (deps.sessions->is_closed(session)) {
            cause = "closed by server";
            break;
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            cause = "poll closed";
            break;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            cause = "closed by peer";
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            cause = "recv error";
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            fps.append(std::span<const char>(span.data(), span.size()));
        std::string payload;
        bool bad_stream = false;
        for (;;) {
            auto r = pong::netutil::try_extract(fps, payload);
            if (r == pong::netutil::ExtractResult::need_more)
                break;
            pong::ClientMessage cmsg;
            if (r == pong::netutil::ExtractResult::invalid
                || !cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                bad_stream = true;
                break;
            }
            dispatch(session, cmsg, deps);
        }
        if (bad_stream) {
            pong::metrics::runtime().frame_errors.fetch_add(1, std::memory_order_relaxed);
            cause = "frame error";
            break;
        }
    }
    deps.presence->peer_lost(session, cause);
    session->client.reset();
    co_return;
}

coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler, uint32_t timeout_sec, ListenerDeps deps)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    while (!pong::g_shutdown.load()) {
        auto now = clock::now();
        for (auto &s : deps.sessions->snapshot_all_sessions()) {
            if (!s->authenticated || s->last_heartbeat.time_since_epoch().count() == 0)
                continue;
            auto diff = std::chrono::duration_cast<std::chrono::seconds>(now - s->last_heartbeat).count();
            if (diff > static_cast<decltype(diff)>(timeout_sec)) {
                pong::log::warn("[hb] timeout player={} diff={}s", s->player_id, diff);
                deps.presence->peer_lost(s, "heartbeat timeout");
            }
        }
        co_await scheduler->yield_for(std::chrono::seconds(1));
    }
    co_return;
}

} // namespace pong::net
