#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace wallet::domain {

/**
 * @brief Кошелёк с балансом в опорной валюте
 *
 * version увеличивается на 1 при каждом успешном изменении баланса
 * и используется только для оптимистичной блокировки (CAS при коммите).
 */
struct Wallet {
    std::string id;             ///< UUID кошелька
    Money balance;              ///< Баланс в опорной валюте, всегда >= 0
    std::string currency = "EGP";  ///< Валюта отображения, фиксируется при создании
    int64_t version = 0;        ///< Версия для оптимистичной блокировки
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace wallet::domain
