#pragma once

#include "domain/Wallet.hpp"
#include "domain/BalanceSnapshot.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Money.hpp"
#include <string>
#include <vector>

namespace wallet::ports::input {

/**
 * @brief Интерфейс жизненного цикла кошелька и чтения его состояния
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    /**
     * @brief Создать кошелёк
     * @param initialBalance Начальный баланс в опорной валюте, >= 0
     * @param currency Валюта отображения (пусто → опорная), из таблицы курсов
     * @throws UnsupportedCurrencyException если валюта неизвестна
     */
    virtual domain::Wallet createWallet(const domain::Money& initialBalance,
                                        const std::string& currency) = 0;

    virtual domain::BalanceSnapshot getBalance(const std::string& walletId) = 0;

    /**
     * @brief История транзакций, новые первыми
     */
    virtual std::vector<domain::LedgerEntry> getTransactionHistory(const std::string& walletId) = 0;
};

} // namespace wallet::ports::input
