#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "core/error.h"
#include "core/types.h"

namespace primitives {

/// Identifies a particular output of a ledger transaction by its txid and
/// index within that transaction's output list.
struct OutPoint {
    /// Id of the transaction that created the output.
    core::uint256 txid;

    /// Zero-based index into that transaction's outputs.
    uint32_t n = 0;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    /// Parse the "<txid_hex>:<index>" form produced by to_string().
    static core::Result<OutPoint> parse(std::string_view text);

    bool operator==(const OutPoint&) const = default;
    auto operator<=>(const OutPoint&) const = default;

    /// Human-readable representation: "<txid_hex>:<index>".
    [[nodiscard]] std::string to_string() const;
};

} // namespace primitives

/// Specialization of std::hash for OutPoint so it can be used as a key in
/// unordered containers.
template<>
struct std::hash<primitives::OutPoint> {
    std::size_t operator()(const primitives::OutPoint& op) const noexcept {
        std::size_t h = std::hash<core::uint256>{}(op.txid);
        // Boost-style combine of the index into the txid hash.
        h ^= static_cast<std::size_t>(op.n) + 0x9e3779b97f4a7c15ULL +
             (h << 6) + (h >> 2);
        return h;
    }
};
