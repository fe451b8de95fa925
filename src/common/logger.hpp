// SPDX-License-Identifier: Apache-2.0
// Asynchronous logger (header-only).
// Lines are queued by the caller and written to stderr by one background thread so the
// tick loop never blocks on terminal I/O. Provides:
//  - Level filtering via PONG_LOG_LEVEL (trace|debug|info|warn|error)
//  - JSON lines via PONG_LOG_JSON presence
//  - Optional process tag via PONG_LOG_APP_ID
//  - Optional external callback (set_callback), invoked from the writer thread

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace pong::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

struct entry
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::string g_app_id; // guarded by g_out_mtx
inline std::mutex g_queue_mtx;
inline std::condition_variable g_queue_cv;
inline std::deque<entry> g_pending;
inline std::mutex g_out_mtx;
inline std::thread g_writer;

using callback_fn = void (*)(int, const char *, void *);
inline std::atomic<callback_fn> g_callback{nullptr};
inline std::atomic<void *> g_callback_ud{nullptr};

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline char level_tag(level lv)
{
    static constexpr std::array<char, 5> tags{'T', 'D', 'I', 'W', 'E'};
    return tags[static_cast<size_t>(lv)];
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return level::trace;
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

inline void json_escape(std::ostream &os, std::string_view s)
{
    for (char c : s) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            default:
                os << c;
        }
    }
}

inline void emit(const entry &e)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(e.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.ts.time_since_epoch()).count() % 1000;
    {
        std::lock_guard lk(g_out_mtx);
        if (g_json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
                      << std::setfill('0') << ms << std::setfill(' ') << "\",\"level\":\"" << level_name(e.lv)
                      << '"';
            if (!g_app_id.empty()) {
                std::cerr << ",\"app\":\"";
                json_escape(std::cerr, g_app_id);
                std::cerr << '"';
            }
            std::cerr << ",\"msg\":\"";
            json_escape(std::cerr, e.text);
            std::cerr << "\"}\n";
        } else {
            if (!g_app_id.empty())
                std::cerr << g_app_id << ' ';
            std::cerr << '[' << level_tag(e.lv) << ' ' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3)
                      << std::setfill('0') << ms << std::setfill(' ') << "] " << e.text << '\n';
        }
        std::cerr.flush();
    }
    if (auto cb = g_callback.load(std::memory_order_acquire))
        cb(static_cast<int>(e.lv), e.text.c_str(), g_callback_ud.load(std::memory_order_relaxed));
}

inline void writer_loop()
{
    for (;;) {
        std::deque<entry> batch;
        {
            std::unique_lock lk(g_queue_mtx);
            g_queue_cv.wait(lk, [] { return !g_pending.empty() || !g_running.load(std::memory_order_acquire); });
            batch.swap(g_pending);
        }
        for (const auto &e : batch)
            emit(e);
        if (!g_running.load(std::memory_order_acquire)) {
            std::lock_guard lk(g_queue_mtx);
            if (g_pending.empty())
                break;
        }
    }
}

inline void stop()
{
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_queue_cv.notify_all();
    if (g_writer.joinable())
        g_writer.join();
}

inline void start()
{
    if (g_started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("PONG_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("PONG_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("PONG_LOG_APP_ID"); app && *app) {
        std::lock_guard lk(g_out_mtx);
        g_app_id.assign(app);
    }
    g_running.store(true, std::memory_order_release);
    g_writer = std::thread(writer_loop);
    std::atexit([] { stop(); });
}

} // namespace detail

// {} placeholder formatting. Surplus arguments are appended space-separated so a
// mismatched format string never drops information.
namespace detail_format {

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(args)...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        size_t pos = 0;
        size_t next = 0;
        while (next < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[next++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; next < values.size(); ++next) {
            out.push_back(' ');
            out += values[next];
        }
        return out;
    }
}

} // namespace detail_format

inline void init()
{
    detail::start();
}

inline void shutdown()
{
    detail::stop();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    std::lock_guard lk(detail::g_out_mtx);
    detail::g_app_id = std::move(id);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    detail::g_callback_ud.store(ud, std::memory_order_relaxed);
    detail::g_callback.store(cb, std::memory_order_release);
}

inline void write(level lv, std::string_view text)
{
    if (!enabled(lv))
        return;
    detail::start();
    {
        std::lock_guard lk(detail::g_queue_mtx);
        detail::g_pending.push_back(detail::entry{lv, std::string(text), std::chrono::system_clock::now()});
    }
    detail::g_queue_cv.notify_one();
}

template <typename... Args>
inline void write(level lv, const char *fmt, const Args &...args)
{
    if (enabled(lv))
        write(lv, std::string_view(detail_format::format(fmt, args...)));
}

template <typename... Args>
inline void trace(const char *fmt, const Args &...args)
{
    write(level::trace, fmt, args...);
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    write(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    write(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    write(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    write(level::error, fmt, args...);
}

} // namespace pong::log
