#pragma once

#include "domain/Wallet.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/BalanceSnapshot.hpp"
#include "domain/ReconciliationReport.hpp"
#include "domain/Money.hpp"
#include "domain/DecimalAmount.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wallet::adapters::primary::json {

/**
 * @brief Сумма из JSON: число (10.5) или строка ("10.50")
 *
 * @throws nlohmann::json::exception если тип поля не число и не строка
 */
inline domain::Money parseAmount(const nlohmann::json& value, const std::string& currency) {
    if (value.is_string()) {
        return domain::Money::fromString(value.get<std::string>(), currency);
    }
    return domain::Money::fromDouble(value.get<double>(), currency);
}

/**
 * @brief Сумма транзакции без округления: число или строка, до 8 знаков
 */
inline domain::DecimalAmount parseDecimal(const nlohmann::json& value, const std::string& currency) {
    if (value.is_string()) {
        return domain::DecimalAmount::fromString(value.get<std::string>(), currency);
    }
    return domain::DecimalAmount::fromDouble(value.get<double>(), currency);
}

inline nlohmann::json toJson(const domain::Wallet& wallet) {
    nlohmann::json j;
    j["id"] = wallet.id;
    j["balance"] = wallet.balance.toDouble();
    j["currency"] = wallet.currency;
    j["created_at"] = wallet.createdAt.toString();
    j["updated_at"] = wallet.updatedAt.toString();
    return j;
}

inline nlohmann::json toJson(const domain::LedgerEntry& entry) {
    nlohmann::json j;
    j["id"] = entry.id;
    j["transaction_id"] = entry.externalId;
    j["wallet_id"] = entry.walletId;
    j["type"] = domain::toString(entry.kind);
    j["amount"] = entry.amount.toDouble();
    j["currency"] = entry.amount.currency;
    j["applied_amount"] = entry.appliedAmount.toDouble();
    j["reference_amount"] = entry.referenceAmount.toDouble();
    j["reference_currency"] = entry.appliedAmount.currency;
    j["metadata"] = entry.metadata;
    j["created_at"] = entry.createdAt.toString();
    return j;
}

inline nlohmann::json toJson(const domain::BalanceSnapshot& snapshot) {
    nlohmann::json j;
    j["wallet_id"] = snapshot.walletId;
    j["balance"] = snapshot.balance.toDouble();
    j["currency"] = snapshot.currency;
    j["last_updated_at"] = snapshot.lastUpdatedAt.toString();
    return j;
}

inline nlohmann::json toJson(const domain::ReconciliationReport& report) {
    nlohmann::json j;
    j["wallet_id"] = report.walletId;
    j["consistent"] = report.consistent;
    j["stored_balance"] = report.storedBalance.toDouble();
    j["ledger_balance"] = report.ledgerBalance.toDouble();
    j["difference"] = report.difference.toDouble();
    return j;
}

} // namespace wallet::adapters::primary::json
