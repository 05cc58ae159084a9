// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <utility>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    size_t begin = 0;
    size_t end = sv.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(sv[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(sv[end - 1])))
        --end;
    return sv.substr(begin, end - begin);
}

/// Split "key=value" (value "1" when there is no '=').
std::pair<std::string_view, std::string_view> split_option(
    std::string_view text) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos) return {trim(text), "1"};
    return {trim(text.substr(0, eq)), trim(text.substr(eq + 1))};
}

std::optional<bool> parse_bool(std::string_view sv) {
    std::string lower;
    for (char c : sv)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

} // namespace

Config::Values* Config::entry(std::string_view key) {
    auto it = values_.find(key);
    if (it == values_.end()) it = values_.emplace(std::string(key), Values{}).first;
    return &it->second;
}

const Config::Values* Config::find(std::string_view key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;
        if (arg.size() < 2 || arg[0] != '-') {
            positionals_.emplace_back(arg);
            continue;
        }
        arg.remove_prefix(arg[1] == '-' ? 2 : 1);
        auto [key, value] = split_option(arg);
        entry(key)->cli.emplace_back(value);
    }
}

Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error(ErrorCode::STORAGE_NOT_FOUND,
                     "Cannot open config file '" + path.string() + "'");
    }
    LOG_INFO(LogCategory::CONFIG, "Reading options from " + path.string());

    std::string line;
    for (int line_no = 1; std::getline(in, line); ++line_no) {
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        auto [key, value] = split_option(sv);
        if (key.empty()) {
            return Error(ErrorCode::PARSE_BAD_FORMAT,
                         path.string() + ":" + std::to_string(line_no) +
                         ": missing option name");
        }
        entry(key)->file.emplace_back(value);
    }
    return make_ok();
}

void Config::set(std::string_view key, std::string value) {
    entry(key)->file.assign(1, std::move(value));
}

std::optional<std::string> Config::get(std::string_view key) const {
    const Values* v = find(key);
    if (!v || v->effective().empty()) return std::nullopt;
    return v->effective().front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view fallback) const {
    return get(key).value_or(std::string(fallback));
}

Result<int64_t> Config::get_int(std::string_view key, int64_t fallback) const {
    auto text = get(key);
    if (!text) return fallback;

    int64_t out = 0;
    const char* first = text->data();
    const char* last = first + text->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return Error(ErrorCode::PARSE_BAD_FORMAT,
                     "Option -" + std::string(key) + ": '" + *text +
                     "' is not an integer");
    }
    return out;
}

bool Config::get_bool(std::string_view key, bool fallback) const {
    auto text = get(key);
    if (!text) return fallback;
    return parse_bool(*text).value_or(fallback);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::vector<std::string> out;
    if (const Values* v = find(key)) {
        out = v->cli;
        out.insert(out.end(), v->file.begin(), v->file.end());
    }
    return out;
}

bool Config::has(std::string_view key) const {
    const Values* v = find(key);
    return v && !v->effective().empty();
}

} // namespace core
