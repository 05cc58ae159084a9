#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <cstdint>
#include <string>

namespace core {

/// Wall-clock Unix time in seconds.
int64_t get_time();

/// "2026-02-03T00:00:00Z"
std::string format_iso8601(int64_t unix_seconds);

/// Unix time that tests can pin. Lock expiry is measured against it.
struct MockableClock {
    /// The pinned time when one is set, else get_time().
    static int64_t now();
    /// Pin the clock at @p unix_seconds; 0 unpins it.
    static void set_mock_time(int64_t unix_seconds);
    static int64_t get_mock_time();
};

/// Measures elapsed wall time on the steady clock from construction.
class StopWatch {
public:
    StopWatch() : start_(std::chrono::steady_clock::now()) {}

    int64_t elapsed_us() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
                   std::chrono::steady_clock::now() - start_)
            .count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
