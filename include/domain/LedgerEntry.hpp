#pragma once

#include "Money.hpp"
#include "DecimalAmount.hpp"
#include "Timestamp.hpp"
#include "enums/TransactionKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wallet::domain {

/**
 * @brief Проведённая транзакция (запись журнала)
 *
 * Записи только добавляются: никогда не изменяются и не удаляются.
 * Баланс кошелька = сумма appliedAmount всех его записей.
 *
 * - amount: исходная сумма и валюта запроса (для аудита, без изменений)
 * - appliedAmount: знаковая сумма в опорной валюте, реально применённая к балансу
 *   (+ для DEPOSIT, - для WITHDRAWAL); участвует в сверке
 * - referenceAmount: та же сумма без знака, только для аудита
 */
struct LedgerEntry {
    std::string id;             ///< UUID записи
    std::string externalId;     ///< Ключ идемпотентности клиента, уникален глобально
    std::string walletId;
    TransactionKind kind = TransactionKind::DEPOSIT;
    DecimalAmount amount;       ///< Исходная сумма клиента, как пришла
    Money appliedAmount;        ///< Знаковая сумма в опорной валюте
    Money referenceAmount;      ///< |appliedAmount|
    nlohmann::json metadata;    ///< Произвольные данные клиента, не интерпретируются
    Timestamp createdAt;
};

} // namespace wallet::domain
