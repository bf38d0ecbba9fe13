#pragma once

#include "DecimalAmount.hpp"
#include "enums/TransactionKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wallet::domain {

/**
 * @brief Запрос на проведение транзакции
 *
 * amount.currency пустая строка → опорная валюта.
 */
struct TransactionRequest {
    std::string externalId;
    std::string walletId;
    TransactionKind kind = TransactionKind::DEPOSIT;
    DecimalAmount amount;       ///< Без округления, до 8 знаков
    nlohmann::json metadata;
};

} // namespace wallet::domain
