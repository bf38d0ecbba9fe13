#pragma once

#include "Money.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Результат сверки баланса с журналом
 *
 * difference = storedBalance - ledgerBalance
 */
struct ReconciliationReport {
    std::string walletId;
    Money storedBalance;
    Money ledgerBalance;
    Money difference;
    bool consistent = false;
};

} // namespace wallet::domain
