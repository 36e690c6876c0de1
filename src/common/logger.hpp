// SPDX-License-Identifier: Apache-2.0
// Asynchronous line logger (header-only).
//  - Level filtering via PONGD_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via PONGD_LOG_JSON
//  - Lines are queued and written to stderr by one background thread so the
//    tick loop never blocks on terminal I/O.

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

namespace pongd::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

inline const char *level_name(level lv)
{
    switch (lv) {
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

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug" || v == "trace")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

namespace detail {

struct line
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

class sink
{
public:
    static sink &get()
    {
        static sink inst;
        return inst;
    }

    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};

    void start()
    {
        std::call_once(m_once, [this] {
            if (const char *lvl = std::getenv("PONGD_LOG_LEVEL"))
                min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
            if (std::getenv("PONGD_LOG_JSON"))
                json.store(true, std::memory_order_relaxed);
            m_running.store(true, std::memory_order_release);
            m_thread = std::thread([this] { consume(); });
            std::atexit([] { sink::get().stop(); });
        });
    }

    void stop()
    {
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;
        m_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    void push(level lv, std::string msg)
    {
        auto ts = std::chrono::system_clock::now();
        if (!m_running.load(std::memory_order_acquire)) {
            emit(lv, msg, ts);
            return;
        }
        {
            std::lock_guard lk(m_mutex);
            m_queue.push_back(line{lv, std::move(msg), ts});
        }
        m_cv.notify_one();
    }

private:
    sink() = default;

    void consume()
    {
        for (;;) {
            std::deque<line> batch;
            {
                std::unique_lock lk(m_mutex);
                m_cv.wait(lk, [this] { return !m_queue.empty() || !m_running.load(std::memory_order_acquire); });
                batch.swap(m_queue);
            }
            for (auto &l : batch)
                emit(l.lv, l.msg, l.ts);
            if (!m_running.load(std::memory_order_acquire)) {
                std::lock_guard lk(m_mutex);
                if (m_queue.empty())
                    break;
            }
        }
    }

    void emit(level lv, const std::string &m, std::chrono::system_clock::time_point tp)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&tt, &tm);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::lock_guard lk(m_io_mutex);
        if (json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
                      << std::setfill('0') << ms << "\",\"level\":\"" << level_name(lv) << "\",\"msg\":\"";
            for (char c : m) {
                if (c == '"' || c == '\\')
                    std::cerr << '\\' << c;
                else if (c == '\n')
                    std::cerr << "\\n";
                else
                    std::cerr << c;
            }
            std::cerr << "\"}\n";
        } else {
            static constexpr std::array<char, 4> tags{'D', 'I', 'W', 'E'};
            std::cerr << '[' << tags[static_cast<int>(lv)] << ' ' << std::put_time(&tm, "%H:%M:%S") << '.'
                      << std::setw(3) << std::setfill('0') << ms << "] " << m << '\n';
        }
        std::cerr.flush();
    }

    std::once_flag m_once;
    std::atomic<bool> m_running{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<line> m_queue;
    std::mutex m_io_mutex;
    std::thread m_thread;
};

template <typename T>
std::string stringify(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_integral_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        if constexpr (std::is_floating_point_v<D>) {
            oss.setf(std::ios::fixed, std::ios::floatfield);
            oss.precision(2);
        }
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" in order; surplus arguments are appended space separated.
template <typename... Args>
std::string format(std::string_view fmt, const Args &...args)
{
    std::array<std::string, sizeof...(Args)> values{stringify(args)...};
    std::string out;
    out.reserve(fmt.size() + sizeof...(Args) * 8);
    size_t pos = 0;
    size_t used = 0;
    while (used < values.size()) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt.substr(pos, p - pos));
        out += values[used++];
        pos = p + 2;
    }
    out.append(fmt.substr(pos));
    for (; used < values.size(); ++used) {
        out.push_back(' ');
        out += values[used];
    }
    return out;
}

} // namespace detail

inline void init()
{
    detail::sink::get().start();
}

inline void shutdown()
{
    detail::sink::get().stop();
}

inline void set_level(level lv) noexcept
{
    detail::sink::get().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::sink::get().json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::sink::get().min_level.load(std::memory_order_relaxed);
}

template <typename... Args>
inline void write(level lv, std::string_view fmt, const Args &...args)
{
    if (!enabled(lv))
        return;
    if constexpr (sizeof...(Args) == 0)
        detail::sink::get().push(lv, std::string(fmt));
    else
        detail::sink::get().push(lv, detail::format(fmt, args...));
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    write(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    write(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    write(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    write(level::error, fmt, args...);
}

} // namespace pongd::log
