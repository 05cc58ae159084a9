// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace core {

namespace {

struct CategoryName {
    LogCategory cat;
    std::string_view name;
};

constexpr std::array<CategoryName, 5> CATEGORY_NAMES{{
    {LogCategory::WALLET, "wallet"},
    {LogCategory::SELECT, "select"},
    {LogCategory::LOCK,   "lock"},
    {LogCategory::LEDGER, "ledger"},
    {LogCategory::CONFIG, "config"},
}};

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// "2026-03-01T09:30:12.418Z"
std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                  tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

} // namespace

std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    if (cat == LogCategory::ALL) return "all";
    for (const auto& entry : CATEGORY_NAMES) {
        if (entry.cat == cat) return entry.name;
    }
    return "none";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (int i = 0; i <= static_cast<int>(LogLevel::OFF); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (iequals(name, log_level_string(level))) return level;
    }
    if (iequals(name, "warning")) return LogLevel::WARN;
    if (iequals(name, "none")) return LogLevel::OFF;
    return std::nullopt;
}

std::optional<LogCategory> parse_log_category(std::string_view name) {
    if (iequals(name, "all") || name == "1") return LogCategory::ALL;
    for (const auto& entry : CATEGORY_NAMES) {
        if (iequals(name, entry.name)) return entry.cat;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::enable_category(LogCategory cat) {
    categories_.fetch_or(static_cast<uint32_t>(cat));
}

void Logger::disable_category(LogCategory cat) {
    categories_.fetch_and(~static_cast<uint32_t>(cat));
}

void Logger::set_categories(uint32_t mask) {
    categories_.store(mask);
}

bool Logger::will_log(LogLevel level, LogCategory cat) const noexcept {
    if (static_cast<int>(level) < level_.load(std::memory_order_relaxed))
        return false;
    const auto bits = static_cast<uint32_t>(cat);
    if (bits != 0 && (categories_.load(std::memory_order_relaxed) & bits) == 0)
        return false;
    return to_console_.load(std::memory_order_relaxed) ||
           to_file_.load(std::memory_order_relaxed);
}

void Logger::set_print_to_console(bool enable) {
    to_console_.store(enable);
}

void Logger::set_print_to_file(bool enable) {
    to_file_.store(enable);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) {
        to_file_.store(false);
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        to_file_.store(false);
        return false;
    }
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_.is_open()) file_.flush();
    std::cerr.flush();
}

void Logger::write(LogLevel level, LogCategory cat, std::string_view message) {
    std::string line = utc_timestamp();
    line += ' ';
    std::string_view lvl = log_level_string(level);
    line += lvl;
    line.append(lvl.size() < 5 ? 6 - lvl.size() : 1, ' ');
    if (cat != LogCategory::NONE) {
        line += log_category_string(cat);
        line += ": ";
    }
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (to_console_.load(std::memory_order_relaxed)) std::cerr << line;
    if (to_file_.load(std::memory_order_relaxed) && file_.is_open()) {
        file_ << line;
        if (level >= LogLevel::WARN) file_.flush();
    }
}

} // namespace core
