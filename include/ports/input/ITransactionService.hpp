#pragma once

#include "domain/TransactionRequest.hpp"
#include "domain/LedgerEntry.hpp"

namespace wallet::ports::input {

/**
 * @brief Интерфейс проведения транзакций
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Провести транзакцию ровно один раз
     *
     * Повторный вызов с тем же externalId возвращает ранее созданную запись.
     *
     * @throws WalletNotFoundException, UnsupportedCurrencyException,
     *         InsufficientFundsException, ConcurrencyExhaustedException,
     *         InvalidRequestException
     */
    virtual domain::LedgerEntry applyTransaction(const domain::TransactionRequest& request) = 0;
};

} // namespace wallet::ports::input
