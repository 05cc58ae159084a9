#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERR   = 4,  // not ERROR: <windows.h> defines that as a macro
    FATAL = 5,
    OFF   = 6,
};

/// Subsystems a message can be attributed to. Values are mask bits.
enum class LogCategory : uint32_t {
    NONE   = 0,
    WALLET = 1u << 0,   // planner, send and consolidate flow
    SELECT = 1u << 1,   // coin selection
    LOCK   = 1u << 2,   // lock table and node-side locks
    LEDGER = 1u << 3,   // ledger node calls
    CONFIG = 1u << 4,
    ALL    = 0xFFFFFFFFu,
};

[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Lower-case name of a single category ("select"); "all" for ALL.
[[nodiscard]] std::string_view log_category_string(LogCategory cat) noexcept;

/// Case-insensitive; accepts "warning" for WARN and "none" for OFF.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Case-insensitive; "all" and "1" select every category.
[[nodiscard]] std::optional<LogCategory> parse_log_category(
    std::string_view name);

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
// Process-wide sink for diagnostic output. Lines go to stderr and, when a
// file is configured, are appended to it:
//
//   2026-03-01T09:30:12.418Z INFO  wallet: Broadcast 3fa9... spending 3 inputs
//
// Filtering state is atomic, so will_log() never takes the write lock.

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);
    /// Replace the enabled set wholesale.
    void set_categories(uint32_t mask);

    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Append to @p path from now on; an empty path closes the file.
    /// Returns false (and turns the file sink off) when it cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    /// Format and emit one line. Callers go through the LOG_* macros, which
    /// check will_log() first.
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> categories_{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool> to_console_{true};
    std::atomic<bool> to_file_{false};

    std::mutex write_mutex_;
    std::ofstream file_;
};

} // namespace core

#define TXP_LOG(lvl, cat, msg)                                            \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat)))              \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
    } while (0)

#define LOG_TRACE(cat, msg) TXP_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) TXP_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  TXP_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  TXP_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) TXP_LOG(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) TXP_LOG(core::LogLevel::FATAL, cat, msg)
