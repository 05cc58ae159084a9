#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "ledger/memory_ledger.h"
#include "primitives/utxo.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledger {

// ---------------------------------------------------------------------------
// UTXO snapshot files
// ---------------------------------------------------------------------------
// One output per line:
//
//     <txid>:<n> <address> <amount> <confirmations> [locked]
//
// <amount> is a decimal coin string ("12.5"). Blank lines and lines
// starting with '#' are ignored.
// ---------------------------------------------------------------------------

/// Parse one snapshot line. Returns nullopt for blank and comment lines.
core::Result<std::optional<primitives::Utxo>> parse_snapshot_line(
    std::string_view line);

/// Read every output in @p path into @p ledger. Returns the number loaded.
core::Result<size_t> load_snapshot(const std::filesystem::path& path,
                                   MemoryLedger& ledger);

/// Write @p outputs to @p path in the format load_snapshot() reads.
core::Result<void> save_snapshot(const std::filesystem::path& path,
                                 const std::vector<primitives::Utxo>& outputs);

} // namespace ledger
