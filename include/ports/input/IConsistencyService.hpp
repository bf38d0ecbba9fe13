#pragma once

#include "domain/ReconciliationReport.hpp"
#include <string>

namespace wallet::ports::input {

/**
 * @brief Интерфейс сверки баланса с журналом транзакций
 */
class IConsistencyService {
public:
    virtual ~IConsistencyService() = default;

    virtual bool checkConsistency(const std::string& walletId) = 0;

    virtual domain::ReconciliationReport reconcile(const std::string& walletId) = 0;
};

} // namespace wallet::ports::input
