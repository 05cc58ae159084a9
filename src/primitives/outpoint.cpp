// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/outpoint.h"

#include <charconv>

namespace primitives {

core::Result<OutPoint> OutPoint::parse(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "Outpoint must be '<txid>:<index>': '" +
                                std::string(text) + "'");
    }

    TXP_TRY_ASSIGN(txid, core::uint256::from_hex(text.substr(0, colon)));

    std::string_view index = text.substr(colon + 1);
    uint32_t n = 0;
    auto [ptr, ec] = std::from_chars(index.data(),
                                     index.data() + index.size(), n);
    if (index.empty() || ec != std::errc{} ||
        ptr != index.data() + index.size()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "Invalid output index in outpoint: '" +
                                std::string(text) + "'");
    }
    return OutPoint(txid, n);
}

std::string OutPoint::to_string() const {
    return txid.to_hex() + ":" + std::to_string(n);
}

} // namespace primitives
