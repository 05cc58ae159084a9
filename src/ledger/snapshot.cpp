// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/snapshot.h"
#include "core/logging.h"
#include "core/time.h"

#include <charconv>
#include <fstream>

namespace ledger {

namespace {

/// Split on runs of spaces and tabs.
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
            ++pos;
        }
        size_t end = pos;
        while (end < line.size() && line[end] != ' ' && line[end] != '\t') {
            ++end;
        }
        if (end > pos) {
            fields.push_back(line.substr(pos, end - pos));
        }
        pos = end;
    }
    return fields;
}

} // namespace

core::Result<std::optional<primitives::Utxo>> parse_snapshot_line(
    std::string_view line) {

    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    auto fields = split_fields(line);
    if (fields.empty() || fields.front().front() == '#') {
        return std::optional<primitives::Utxo>{};
    }

    if (fields.size() != 4 && fields.size() != 5) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "Expected '<txid>:<n> <address> <amount> "
                           "<confirmations> [locked]', got " +
                           std::to_string(fields.size()) + " fields");
    }

    primitives::Utxo utxo;
    TXP_TRY_ASSIGN(outpoint, primitives::OutPoint::parse(fields[0]));
    utxo.outpoint = outpoint;
    utxo.address = std::string(fields[1]);
    TXP_TRY_ASSIGN(amount, primitives::Amount::parse(fields[2]));
    utxo.amount = amount;

    std::string_view conf = fields[3];
    auto [ptr, ec] = std::from_chars(conf.data(), conf.data() + conf.size(),
                                     utxo.confirmations);
    if (ec != std::errc{} || ptr != conf.data() + conf.size() ||
        utxo.confirmations < 0) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "Invalid confirmation count '" +
                           std::string(conf) + "'");
    }

    if (fields.size() == 5) {
        if (fields[4] != "locked") {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "Unknown flag '" + std::string(fields[4]) +
                               "'");
        }
        utxo.locked = true;
    }
    return std::optional<primitives::Utxo>{utxo};
}

core::Result<size_t> load_snapshot(const std::filesystem::path& path,
                                   MemoryLedger& ledger) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "Snapshot: unable to open '" + path.string() + "'");
    }

    std::string line;
    int line_num = 0;
    size_t loaded = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        auto parsed = parse_snapshot_line(line);
        if (!parsed.ok()) {
            return core::Error(parsed.error().code(),
                               "Snapshot: line " + std::to_string(line_num) +
                               " of '" + path.string() + "': " +
                               parsed.error().message());
        }
        if (parsed.value()) {
            ledger.add_output(*parsed.value());
            ++loaded;
        }
    }

    LOG_INFO(core::LogCategory::LEDGER,
             "Snapshot: loaded " + std::to_string(loaded) +
             " outputs from '" + path.string() + "'");
    return loaded;
}

core::Result<void> save_snapshot(const std::filesystem::path& path,
                                 const std::vector<primitives::Utxo>& outputs) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "Snapshot: unable to write '" + path.string() + "'");
    }

    ofs << "# saved " << core::format_iso8601(core::get_time()) << '\n';
    ofs << "# txid:n address amount confirmations [locked]\n";
    for (const auto& u : outputs) {
        ofs << u.outpoint.to_string() << ' ' << u.address << ' '
            << u.amount.to_string() << ' ' << u.confirmations;
        if (u.locked) ofs << " locked";
        ofs << '\n';
    }
    if (!ofs) {
        return core::Error(core::ErrorCode::STORAGE_ERROR,
                           "Snapshot: write to '" + path.string() +
                           "' failed");
    }
    return core::make_ok();
}

} // namespace ledger
