/**
 * @file WalletServiceTest.cpp
 * @brief Unit-тесты для WalletService
 */

#include <gtest/gtest.h>

#include "application/WalletService.hpp"
#include "application/TransactionService.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/StaticRateTable.hpp"

using namespace wallet;
using namespace wallet::application;

class WalletServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        currency_ = std::make_shared<CurrencyService>(
            std::make_shared<adapters::secondary::StaticRateTable>(), "EGP");
        service_ = std::make_unique<WalletService>(repo_, currency_);
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repo_;
    std::shared_ptr<CurrencyService> currency_;
    std::unique_ptr<WalletService> service_;
};

TEST_F(WalletServiceTest, CreateWallet_ZeroBalance_NoOpeningEntry) {
    auto wallet = service_->createWallet(domain::Money::fromMinor(0), "");

    EXPECT_FALSE(wallet.id.empty());
    EXPECT_EQ(wallet.currency, "EGP");
    EXPECT_TRUE(wallet.balance.isZero());
    EXPECT_EQ(wallet.version, 0);
    EXPECT_EQ(repo_->walletCount(), 1u);
    EXPECT_EQ(repo_->entryCount(), 0u);
}

TEST_F(WalletServiceTest, CreateWallet_InitialBalance_WritesOpeningEntry) {
    auto wallet = service_->createWallet(domain::Money::fromDouble(1000.0), "EGP");

    auto opening = repo_->findEntryByExternalId("opening-" + wallet.id);
    ASSERT_TRUE(opening.has_value());
    EXPECT_EQ(opening->walletId, wallet.id);
    EXPECT_EQ(opening->kind, domain::TransactionKind::DEPOSIT);
    EXPECT_EQ(opening->appliedAmount.minor, 100000);
    EXPECT_EQ(opening->metadata["type"], "opening_balance");

    EXPECT_EQ(repo_->sumAppliedAmountsForWallet(wallet.id).minor, wallet.balance.minor);
}

TEST_F(WalletServiceTest, CreateWallet_NegativeBalance_Rejected) {
    EXPECT_THROW(service_->createWallet(domain::Money::fromMinor(-1), "EGP"),
                 domain::InvalidRequestException);
    EXPECT_EQ(repo_->walletCount(), 0u);
}

TEST_F(WalletServiceTest, CreateWallet_DisplayCurrencyUpperCased) {
    auto wallet = service_->createWallet(domain::Money::fromMinor(0), "usd");

    EXPECT_EQ(wallet.currency, "USD");
}

TEST_F(WalletServiceTest, CreateWallet_UnknownCurrency_Rejected) {
    EXPECT_THROW(service_->createWallet(domain::Money::fromMinor(0), "TOOLONGCODE"),
                 domain::UnsupportedCurrencyException);
    EXPECT_THROW(service_->createWallet(domain::Money::fromMinor(0), "XYZ"),
                 domain::UnsupportedCurrencyException);
    EXPECT_EQ(repo_->walletCount(), 0u);
}

TEST_F(WalletServiceTest, CreateWallet_HugeInitialBalance_Rejected) {
    EXPECT_THROW(service_->createWallet(domain::Money::fromMinor(INT64_MAX), "EGP"),
                 domain::InvalidRequestException);
    EXPECT_EQ(repo_->walletCount(), 0u);

    auto wallet = service_->createWallet(domain::Money::fromMinor(WalletService::kMaxInitialMinor), "EGP");
    EXPECT_EQ(wallet.balance.minor, WalletService::kMaxInitialMinor);
}

TEST_F(WalletServiceTest, CreateWallet_UniqueIds) {
    auto a = service_->createWallet(domain::Money::fromMinor(0), "");
    auto b = service_->createWallet(domain::Money::fromMinor(0), "");

    EXPECT_NE(a.id, b.id);
}

TEST_F(WalletServiceTest, GetBalance_ReturnsSnapshot) {
    auto wallet = service_->createWallet(domain::Money::fromDouble(12.5), "EGP");

    auto snapshot = service_->getBalance(wallet.id);

    EXPECT_EQ(snapshot.walletId, wallet.id);
    EXPECT_EQ(snapshot.balance.minor, 1250);
    EXPECT_EQ(snapshot.currency, "EGP");
    EXPECT_EQ(snapshot.lastUpdatedAt, wallet.updatedAt);
}

TEST_F(WalletServiceTest, GetBalance_UnknownWallet_Throws) {
    EXPECT_THROW(service_->getBalance("missing"), domain::WalletNotFoundException);
    EXPECT_THROW(service_->getTransactionHistory("missing"), domain::WalletNotFoundException);
}

TEST_F(WalletServiceTest, History_NewestFirst) {
    auto wallet = service_->createWallet(domain::Money::fromDouble(10.0), "EGP");
    TransactionService transactions(repo_, currency_, RetryPolicy{}, [](std::chrono::milliseconds) {});

    for (int i = 1; i <= 3; ++i) {
        domain::TransactionRequest req;
        req.externalId = "tx-" + std::to_string(i);
        req.walletId = wallet.id;
        req.kind = domain::TransactionKind::DEPOSIT;
        req.amount = domain::DecimalAmount::fromDouble(1.0);
        transactions.applyTransaction(req);
    }

    auto history = service_->getTransactionHistory(wallet.id);

    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].externalId, "tx-3");
    EXPECT_EQ(history[1].externalId, "tx-2");
    EXPECT_EQ(history[2].externalId, "tx-1");
    EXPECT_EQ(history[3].externalId, "opening-" + wallet.id);
}
