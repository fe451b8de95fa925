// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/shutdown.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>

namespace pong::net {

namespace {

void emit(std::ostringstream &oss, const char *name, const char *type, uint64_t value)
{
    oss << "# TYPE " << name << ' ' << type << '\n' << name << ' ' << value << '\n';
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = pong::metrics::runtime();
    uint64_t samples = rt.tick_samples.load();
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
    emit(oss, "pong_queue_depth", "gauge", rt.queue_depth.load());
    emit(oss, "pong_active_matches", "gauge", rt.active_matches.load());
    emit(oss, "pong_connected_players", "gauge", rt.connected_players.load());
    emit(oss, "pong_matches_started_total", "counter", rt.matches_started.load());
    emit(oss, "pong_matches_finished_total", "counter", rt.matches_finished.load());
    emit(oss, "pong_matches_cancelled_total", "counter", rt.matches_cancelled.load());
    emit(oss, "pong_forfeits_total", "counter", rt.forfeits.load());
    emit(oss, "pong_snapshots_sent_total", "counter", rt.snapshots_sent.load());
    emit(oss, "pong_inputs_rate_limited_total", "counter", rt.inputs_rate_limited.load());
    emit(oss, "pong_inputs_rejected_total", "counter", rt.inputs_rejected.load());
    emit(oss, "pong_settlements_ok_total", "counter", rt.settlements_ok.load());
    emit(oss, "pong_settlements_failed_total", "counter", rt.settlements_failed.load());
    emit(oss, "pong_auth_failures_total", "counter", rt.auth_failures.load());
    emit(oss, "pong_frame_errors_total", "counter", rt.frame_errors.load());
    emit(oss, "pong_avg_tick_ns", "gauge", avg_ns);
    emit(oss, "pong_p99_tick_ns", "gauge", pong::metrics::approx_tick_p99());
    // Tick duration histogram; buckets are geometric (x2) starting at 250k ns.
    oss << "# TYPE pong_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    constexpr uint64_t base = 250000;
    for (int i = 0; i < pong::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        oss << "pong_tick_duration_ns_bucket{le=\"" << (base << i) << "\"} " << cumulative << '\n';
    }
    oss << "pong_tick_duration_ns_bucket{le=\"+Inf\"} " << samples << '\n';
    oss << "pong_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << '\n';
    oss << "pong_tick_duration_ns_count " << samples << '\n';
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // one-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    pong::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!pong::g_shutdown.load()) {
        auto st = co_await server.poll(std::chrono::milliseconds(500));
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            pong::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace pong::net
