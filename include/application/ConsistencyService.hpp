#pragma once

#include "ports/input/IConsistencyService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "domain/exceptions/WalletNotFoundException.hpp"
#include <memory>
#include <cstdlib>
#include <iostream>

namespace wallet::application {

/**
 * @brief Сверка хранимого баланса с журналом транзакций
 *
 * Пересчитывает баланс агрегатом на стороне хранилища (Σ appliedAmount)
 * и сравнивает с сохранённым. Допуск: |разница| < 0.01.
 * Только чтение.
 */
class ConsistencyService : public ports::input::IConsistencyService {
public:
    /// Строго меньше одной минимальной единицы
    static constexpr int64_t kToleranceMinor = 1;

    explicit ConsistencyService(std::shared_ptr<ports::output::ILedgerRepository> ledger)
        : ledger_(std::move(ledger))
    {
        std::cout << "[ConsistencyService] Created" << std::endl;
    }

    bool checkConsistency(const std::string& walletId) override {
        return reconcile(walletId).consistent;
    }

    domain::ReconciliationReport reconcile(const std::string& walletId) override {
        auto wallet = ledger_->findWalletById(walletId);
        if (!wallet) {
            throw domain::WalletNotFoundException(walletId);
        }

        const domain::Money ledgerSum = ledger_->sumAppliedAmountsForWallet(walletId);

        domain::ReconciliationReport report;
        report.walletId = walletId;
        report.storedBalance = wallet->balance;
        report.ledgerBalance = domain::Money(ledgerSum.minor, wallet->balance.currency);
        report.difference = wallet->balance - report.ledgerBalance;
        report.consistent = std::llabs(report.difference.minor) < kToleranceMinor;

        if (!report.consistent) {
            std::cerr << "[ConsistencyService] Balance inconsistency detected for wallet " << walletId
                      << ": stored=" << report.storedBalance.toString()
                      << ", calculated=" << report.ledgerBalance.toString() << std::endl;
        }

        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> ledger_;
};

} // namespace wallet::application
