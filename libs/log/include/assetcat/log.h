#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>

namespace assetcat::log {

// A message prints when its level is at or below the threshold.
enum class Level : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

inline std::atomic<Level> threshold{Level::Warn};
inline std::atomic<bool> stamp_lines{false};

// set_verbosity maps a -v count: 0 keeps warnings and errors, 1 adds info,
// 2 adds debug.
inline void set_verbosity(int v) {
    threshold.store(static_cast<Level>(std::clamp(v, 0, 2) + 1));
}

// set_timestamps prefixes every line with a UTC time (used by the daemon).
inline void set_timestamps(bool enabled) { stamp_lines.store(enabled); }

inline bool enabled(Level l) { return l <= threshold.load(); }

namespace detail {

inline std::mutex line_mutex;
inline std::mutex once_mutex;
inline std::unordered_set<std::string> once_seen;

inline const char* tag(Level l) {
    switch (l) {
    case Level::Error: return "[ERROR]";
    case Level::Warn: return "[WARN]";
    case Level::Info: return "[INFO]";
    case Level::Debug: return "[DEBUG]";
    }
    return "[?]";
}

inline void stamp(std::ostream& out) {
    auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_val{};
    if (gmtime_r(&tt, &tm_val) == nullptr) return;
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ ", &tm_val);
    out << buf;
}

// first_time reports whether key is new to this process.
inline bool first_time(const std::string& key) {
    std::lock_guard<std::mutex> lock(once_mutex);
    return once_seen.insert(key).second;
}

} // namespace detail

// write formats one line and hands it to stderr whole, so lines from worker
// threads never interleave.
template <typename... Args>
void write(Level l, Args&&... args) {
    if (!enabled(l)) return;
    std::ostringstream line;
    if (stamp_lines.load()) detail::stamp(line);
    line << detail::tag(l);
    ((line << ' ' << std::forward<Args>(args)), ...);
    line << '\n';
    std::lock_guard<std::mutex> lock(detail::line_mutex);
    std::cerr << line.str();
}

} // namespace assetcat::log

#define LOGE(...) ::assetcat::log::write(::assetcat::log::Level::Error, __VA_ARGS__)
#define LOGW(...) ::assetcat::log::write(::assetcat::log::Level::Warn, __VA_ARGS__)
#define LOGI(...) ::assetcat::log::write(::assetcat::log::Level::Info, __VA_ARGS__)

// LOGW_ONCE warns the first time key (a string) is seen.
#define LOGW_ONCE(key, ...) \
    do { \
        if (::assetcat::log::detail::first_time(key)) LOGW(__VA_ARGS__); \
    } while (false)

#if ASSETCAT_DEBUG
    #define LOGD(...) ::assetcat::log::write(::assetcat::log::Level::Debug, __VA_ARGS__)
#else
    #define LOGD(...) do {} while (false)
#endif
