#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/input/IConsistencyService.hpp"
#include <gmock/gmock.h>

namespace wallet::tests {

class MockTransactionService : public ports::input::ITransactionService {
public:
    MOCK_METHOD(domain::LedgerEntry, applyTransaction, (const domain::TransactionRequest&), (override));
};

class MockWalletService : public ports::input::IWalletService {
public:
    MOCK_METHOD(domain::Wallet, createWallet, (const domain::Money&, const std::string&), (override));
    MOCK_METHOD(domain::BalanceSnapshot, getBalance, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::LedgerEntry>, getTransactionHistory, (const std::string&), (override));
};

class MockConsistencyService : public ports::input::IConsistencyService {
public:
    MOCK_METHOD(bool, checkConsistency, (const std::string&), (override));
    MOCK_METHOD(domain::ReconciliationReport, reconcile, (const std::string&), (override));
};

} // namespace wallet::tests
