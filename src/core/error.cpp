// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                 return "NONE";

        case ErrorCode::PARSE_ERROR:          return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:       return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:     return "PARSE_BAD_FORMAT";

        case ErrorCode::VALIDATION_ERROR:     return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:     return "VALIDATION_RANGE";

        case ErrorCode::NETWORK_ERROR:        return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:      return "NETWORK_TIMEOUT";

        case ErrorCode::STORAGE_ERROR:        return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:    return "STORAGE_NOT_FOUND";

        // Wallet / selection
        case ErrorCode::INSUFFICIENT_FUNDS:   return "INSUFFICIENT_FUNDS";
        case ErrorCode::NO_CHANGE_FREE_SOLUTION:
            return "NO_CHANGE_FREE_SOLUTION";
        case ErrorCode::DUST_CHANGE_REJECTED: return "DUST_CHANGE_REJECTED";
        case ErrorCode::CONSOLIDATION_NOT_BENEFICIAL:
            return "CONSOLIDATION_NOT_BENEFICIAL";
        case ErrorCode::FEE_LIMIT_EXCEEDED:   return "FEE_LIMIT_EXCEEDED";

        // Ledger boundary
        case ErrorCode::INVENTORY_UNAVAILABLE:
            return "INVENTORY_UNAVAILABLE";
        case ErrorCode::SIGNING_FAILED:       return "SIGNING_FAILED";
        case ErrorCode::BROADCAST_FAILED:     return "BROADCAST_FAILED";

        case ErrorCode::UTXO_LOCK_CONFLICT:   return "UTXO_LOCK_CONFLICT";

        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::INVENTORY_UNAVAILABLE:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::NETWORK_TIMEOUT:
        case ErrorCode::UTXO_LOCK_CONFLICT:
            return true;
        default:
            return false;
    }
}

std::string Error::format() const {
    if (code_ == ErrorCode::NONE) return "no error";

    std::ostringstream out;
    out << error_code_name(code_) << '(' << static_cast<unsigned>(code_) << ')';
    if (!message_.empty()) out << ": " << message_;
    if (const char* file = where_.file_name(); file && *file) {
        out << " [" << file << ':' << where_.line() << ']';
    }
    return out.str();
}

namespace detail {

void throw_bad_result_access(bool wanted_value) {
    throw std::logic_error(wanted_value ? "Result::value() on an error"
                                        : "Result::error() on a value");
}

} // namespace detail

} // namespace core
