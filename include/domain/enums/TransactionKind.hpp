#pragma once

#include <string>
#include <optional>

namespace wallet::domain {

enum class TransactionKind {
    DEPOSIT,
    WITHDRAWAL
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::DEPOSIT: return "DEPOSIT";
        case TransactionKind::WITHDRAWAL: return "WITHDRAWAL";
        default: return "UNKNOWN";
    }
}

inline std::optional<TransactionKind> parseTransactionKind(const std::string& str) {
    if (str == "DEPOSIT") return TransactionKind::DEPOSIT;
    if (str == "WITHDRAWAL") return TransactionKind::WITHDRAWAL;
    return std::nullopt;
}

} // namespace wallet::domain
