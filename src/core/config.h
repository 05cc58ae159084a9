#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Option names, shared by the command line and the config file.
inline constexpr const char* CONF_CONF                 = "conf";
inline constexpr const char* CONF_LOGLEVEL             = "loglevel";
inline constexpr const char* CONF_LOGFILE              = "logfile";
inline constexpr const char* CONF_DEBUG                = "debug";
inline constexpr const char* CONF_SNAPSHOT             = "snapshot";
inline constexpr const char* CONF_FROM                 = "from";
inline constexpr const char* CONF_CHANGEADDRESS        = "changeaddress";
inline constexpr const char* CONF_COMMIT               = "commit";
inline constexpr const char* CONF_FEERATE              = "feerate";
inline constexpr const char* CONF_MINFEE               = "minfee";
inline constexpr const char* CONF_MAXFEE               = "maxfee";
inline constexpr const char* CONF_DUSTTHRESHOLD        = "dustthreshold";
inline constexpr const char* CONF_MAXOVERPAY           = "maxoverpay";
inline constexpr const char* CONF_MINCONF              = "minconf";
inline constexpr const char* CONF_LOCKTIMEOUT          = "locktimeout";
inline constexpr const char* CONF_CONSOLIDATETHRESHOLD = "consolidatethreshold";
inline constexpr const char* CONF_CONSOLIDATEMAXINPUTS = "consolidatemaxinputs";
inline constexpr const char* CONF_MINPAYMENT           = "minpayment";
inline constexpr const char* CONF_MAXPAYMENT           = "maxpayment";

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------
// Options from the command line (-key=value, --key, bare words as
// positionals) and from a key=value file. A key given on the command line
// hides every file value for it. Keys may repeat; get() sees the first
// value and get_list() all of them.

class Config {
public:
    void parse_args(int argc, char* argv[]);

    /// Read @p path: one key=value per line, '#' comments, a bare key is a
    /// flag. STORAGE_NOT_FOUND when the file cannot be opened.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    /// Replace every file-level value of @p key.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view fallback) const;

    /// PARSE_BAD_FORMAT when present but not an integer.
    [[nodiscard]] Result<int64_t> get_int(std::string_view key,
                                          int64_t fallback = 0) const;

    /// 1/true/yes/on and 0/false/no/off; anything else gives @p fallback.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool fallback = false) const;

    /// Command-line values, then file values.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positionals() const {
        return positionals_;
    }

private:
    struct Values {
        std::vector<std::string> cli;
        std::vector<std::string> file;

        const std::vector<std::string>& effective() const {
            return cli.empty() ? file : cli;
        }
    };

    Values* entry(std::string_view key);
    const Values* find(std::string_view key) const;

    std::map<std::string, Values, std::less<>> values_;
    std::vector<std::string> positionals_;
};

} // namespace core
