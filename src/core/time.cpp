// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/time.h"

#include <atomic>
#include <ctime>

namespace core {

namespace {
std::atomic<int64_t> g_mock_time{0};
} // namespace

int64_t get_time() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_iso8601(int64_t unix_seconds) {
    const auto tt = static_cast<std::time_t>(unix_seconds);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

int64_t MockableClock::now() {
    const int64_t pinned = g_mock_time.load(std::memory_order_relaxed);
    return pinned != 0 ? pinned : get_time();
}

void MockableClock::set_mock_time(int64_t unix_seconds) {
    g_mock_time.store(unix_seconds, std::memory_order_relaxed);
}

int64_t MockableClock::get_mock_time() {
    return g_mock_time.load(std::memory_order_relaxed);
}

} // namespace core
