#pragma once

#include "WalletException.hpp"
#include "domain/Money.hpp"

namespace wallet::domain {

/**
 * @brief Списание увело бы баланс ниже нуля
 *
 * Не ретраится: клиент получает детерминированный ответ
 * с текущим балансом, запрошенной суммой и нехваткой.
 */
class InsufficientFundsException : public WalletException {
public:
    InsufficientFundsException(const Money& currentBalance, const Money& requestedAmount)
        : WalletException("INSUFFICIENT_FUNDS",
                          "Insufficient funds: balance " + currentBalance.toString() +
                          ", requested " + requestedAmount.toString())
        , currentBalance_(currentBalance)
        , requestedAmount_(requestedAmount) {}

    const Money& currentBalance() const noexcept { return currentBalance_; }
    const Money& requestedAmount() const noexcept { return requestedAmount_; }
    Money shortfall() const { return requestedAmount_ - currentBalance_; }

private:
    Money currentBalance_;
    Money requestedAmount_;
};

} // namespace wallet::domain
