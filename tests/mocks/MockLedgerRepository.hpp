#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <gmock/gmock.h>

namespace wallet::tests {

/**
 * @brief gmock реализация ILedgerRepository
 *
 * Для сценариев, которые сложно получить на настоящем хранилище:
 * бесконечные конфликты версий, "потерянный" дубликат и т.п.
 */
class MockLedgerRepository : public ports::output::ILedgerRepository {
public:
    MOCK_METHOD(std::optional<domain::LedgerEntry>, findEntryByExternalId, (const std::string&), (override));
    MOCK_METHOD(std::optional<domain::Wallet>, findWalletById, (const std::string&), (override));
    MOCK_METHOD(ports::output::CommitResult, insertEntryAndUpdateWalletAtomic,
                (const domain::LedgerEntry&, const domain::Wallet&, int64_t), (override));
    MOCK_METHOD(domain::Money, sumAppliedAmountsForWallet, (const std::string&), (override));
    MOCK_METHOD(void, insertWallet, (const domain::Wallet&, const std::optional<domain::LedgerEntry>&), (override));
    MOCK_METHOD(std::vector<domain::LedgerEntry>, findEntriesByWalletId, (const std::string&), (override));
};

} // namespace wallet::tests
