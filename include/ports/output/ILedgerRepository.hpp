#pragma once

#include "domain/Wallet.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Money.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace wallet::ports::output {

/**
 * @brief Результат атомарного коммита транзакции
 */
enum class CommitResult {
    COMMITTED,              ///< Запись добавлена, кошелёк обновлён
    VERSION_CONFLICT,       ///< Версия кошелька изменилась после загрузки, ничего не записано
    DUPLICATE_EXTERNAL_ID   ///< externalId уже занят другой записью, ничего не записано
};

inline std::string toString(CommitResult result) {
    switch (result) {
        case CommitResult::COMMITTED: return "COMMITTED";
        case CommitResult::VERSION_CONFLICT: return "VERSION_CONFLICT";
        case CommitResult::DUPLICATE_EXTERNAL_ID: return "DUPLICATE_EXTERNAL_ID";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Хранилище кошельков и журнала транзакций
 *
 * Гарантии реализации:
 * - вставка записи и обновление кошелька коммитятся атомарно (всё или ничего)
 * - externalId уникален среди всех записей
 * - закоммиченные данные долговечны
 *
 * @example
 * ```cpp
 * auto wallet = repo->findWalletById(id);          // version = 7
 * domain::Wallet updated = *wallet;
 * updated.balance = wallet->balance + applied;
 * switch (repo->insertEntryAndUpdateWalletAtomic(entry, updated, wallet->version)) {
 *     case CommitResult::COMMITTED: ...             // version = 8
 *     case CommitResult::VERSION_CONFLICT: ...      // перечитать и повторить
 *     case CommitResult::DUPLICATE_EXTERNAL_ID: ... // вернуть запись победителя
 * }
 * ```
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    virtual std::optional<domain::LedgerEntry> findEntryByExternalId(const std::string& externalId) = 0;

    virtual std::optional<domain::Wallet> findWalletById(const std::string& walletId) = 0;

    /**
     * @brief Compare-and-swap коммит транзакции
     *
     * Добавляет entry и записывает wallet.balance / wallet.updatedAt
     * с version = expectedVersion + 1, только если сохранённая версия
     * кошелька всё ещё равна expectedVersion.
     *
     * Прочие сбои хранилища выбрасываются исключением.
     */
    virtual CommitResult insertEntryAndUpdateWalletAtomic(
        const domain::LedgerEntry& entry,
        const domain::Wallet& wallet,
        int64_t expectedVersion) = 0;

    /**
     * @brief Сумма appliedAmount всех записей кошелька (0, если записей нет)
     */
    virtual domain::Money sumAppliedAmountsForWallet(const std::string& walletId) = 0;

    /**
     * @brief Сохранить новый кошелёк (и, если задана, запись начального баланса) атомарно
     */
    virtual void insertWallet(
        const domain::Wallet& wallet,
        const std::optional<domain::LedgerEntry>& openingEntry = std::nullopt) = 0;

    /**
     * @brief Записи кошелька, новые первыми
     */
    virtual std::vector<domain::LedgerEntry> findEntriesByWalletId(const std::string& walletId) = 0;
};

} // namespace wallet::ports::output
