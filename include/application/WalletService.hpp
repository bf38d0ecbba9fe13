#pragma once

#include "ports/input/IWalletService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/CurrencyService.hpp"
#include "domain/exceptions/WalletNotFoundException.hpp"
#include "domain/exceptions/InvalidRequestException.hpp"
#include "domain/exceptions/UnsupportedCurrencyException.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <iostream>

namespace wallet::application {

/**
 * @brief Сервис жизненного цикла кошелька
 *
 * Кошелёк с ненулевым начальным балансом получает запись журнала
 * "opening-{walletId}" (DEPOSIT на всю сумму), сохраняемую атомарно вместе
 * с кошельком. Так balance == Σ appliedAmount выполняется с момента создания.
 */
class WalletService : public ports::input::IWalletService {
public:
    static constexpr const char* kOpeningPrefix = "opening-";
    /// Начальный баланс должен помещаться в сумму открывающей записи
    static constexpr int64_t kMaxInitialMinor =
        INT64_MAX / (domain::DecimalAmount::kScale / domain::Money::kScale);

    WalletService(
        std::shared_ptr<ports::output::ILedgerRepository> ledger,
        std::shared_ptr<CurrencyService> currency
    ) : ledger_(std::move(ledger))
      , currency_(std::move(currency))
    {
        std::cout << "[WalletService] Created" << std::endl;
    }

    domain::Wallet createWallet(const domain::Money& initialBalance,
                                const std::string& currency) override {
        if (initialBalance.isNegative()) {
            throw domain::InvalidRequestException("initialBalance must not be negative");
        }
        if (initialBalance.minor > kMaxInitialMinor) {
            throw domain::InvalidRequestException("initialBalance is too large");
        }

        const std::string displayCurrency = currency.empty() ? currency_->referenceCurrency()
                                                             : CurrencyService::toUpper(currency);
        if (!currency_->isSupported(displayCurrency)) {
            throw domain::UnsupportedCurrencyException(displayCurrency);
        }

        const auto now = domain::Timestamp::now();

        domain::Wallet wallet;
        wallet.id = utils::UuidGenerator::generate();
        wallet.currency = displayCurrency;
        wallet.balance = domain::Money(initialBalance.minor, wallet.currency);
        wallet.version = 0;
        wallet.createdAt = now;
        wallet.updatedAt = now;

        std::optional<domain::LedgerEntry> opening;
        if (initialBalance.isPositive()) {
            domain::LedgerEntry entry;
            entry.id = utils::UuidGenerator::generate();
            entry.externalId = kOpeningPrefix + wallet.id;
            entry.walletId = wallet.id;
            entry.kind = domain::TransactionKind::DEPOSIT;
            entry.appliedAmount = domain::Money(initialBalance.minor, currency_->referenceCurrency());
            entry.referenceAmount = entry.appliedAmount;
            entry.amount = domain::DecimalAmount::fromMoney(entry.appliedAmount);
            entry.metadata = {{"type", "opening_balance"}};
            entry.createdAt = now;
            opening = entry;
        }

        ledger_->insertWallet(wallet, opening);

        std::cout << "[WalletService] Created wallet " << wallet.id
                  << " with balance " << wallet.balance.toString() << " " << wallet.currency << std::endl;
        return wallet;
    }

    domain::BalanceSnapshot getBalance(const std::string& walletId) override {
        auto wallet = requireWallet(walletId);

        domain::BalanceSnapshot snapshot;
        snapshot.walletId = wallet.id;
        snapshot.balance = wallet.balance;
        snapshot.currency = wallet.currency;
        snapshot.lastUpdatedAt = wallet.updatedAt;
        return snapshot;
    }

    std::vector<domain::LedgerEntry> getTransactionHistory(const std::string& walletId) override {
        requireWallet(walletId);
        return ledger_->findEntriesByWalletId(walletId);
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> ledger_;
    std::shared_ptr<CurrencyService> currency_;

    domain::Wallet requireWallet(const std::string& walletId) {
        auto wallet = ledger_->findWalletById(walletId);
        if (!wallet) {
            throw domain::WalletNotFoundException(walletId);
        }
        return *wallet;
    }
};

} // namespace wallet::application
