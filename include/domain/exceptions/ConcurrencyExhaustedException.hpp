#pragma once

#include "WalletException.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Все попытки коммита проиграли конкурентным писателям
 *
 * Временная ошибка: повтор с тем же externalId безопасен.
 */
class ConcurrencyExhaustedException : public WalletException {
public:
    ConcurrencyExhaustedException(const std::string& walletId,
                                  const std::string& externalId,
                                  int attempts)
        : WalletException("CONCURRENCY_EXHAUSTED",
                          "Transaction " + externalId + " on wallet " + walletId +
                          " failed after " + std::to_string(attempts) + " attempts")
        , walletId_(walletId)
        , externalId_(externalId)
        , attempts_(attempts) {}

    const std::string& walletId() const noexcept { return walletId_; }
    const std::string& externalId() const noexcept { return externalId_; }
    int attempts() const noexcept { return attempts_; }

private:
    std::string walletId_;
    std::string externalId_;
    int attempts_;
};

} // namespace wallet::domain
