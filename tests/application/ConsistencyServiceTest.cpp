/**
 * @file ConsistencyServiceTest.cpp
 * @brief Unit-тесты для ConsistencyService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/ConsistencyService.hpp"
#include "application/WalletService.hpp"
#include "application/TransactionService.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/StaticRateTable.hpp"
#include "mocks/MockLedgerRepository.hpp"

using namespace wallet;
using namespace wallet::application;
using ::testing::Return;

class ConsistencyServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        currency_ = std::make_shared<CurrencyService>(
            std::make_shared<adapters::secondary::StaticRateTable>(), "EGP");
        walletService_ = std::make_unique<WalletService>(repo_, currency_);
        service_ = std::make_unique<ConsistencyService>(repo_);
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repo_;
    std::shared_ptr<CurrencyService> currency_;
    std::unique_ptr<WalletService> walletService_;
    std::unique_ptr<ConsistencyService> service_;
};

TEST_F(ConsistencyServiceTest, EmptyWallet_Consistent) {
    auto wallet = walletService_->createWallet(domain::Money::fromMinor(0), "");

    EXPECT_TRUE(service_->checkConsistency(wallet.id));
}

TEST_F(ConsistencyServiceTest, WalletWithInitialBalance_Consistent) {
    auto wallet = walletService_->createWallet(domain::Money::fromDouble(1000.0), "");

    auto report = service_->reconcile(wallet.id);

    EXPECT_TRUE(report.consistent);
    EXPECT_EQ(report.storedBalance.minor, 100000);
    EXPECT_EQ(report.ledgerBalance.minor, 100000);
    EXPECT_TRUE(report.difference.isZero());
}

TEST_F(ConsistencyServiceTest, AfterTransactions_Consistent) {
    auto wallet = walletService_->createWallet(domain::Money::fromDouble(50.0), "");
    TransactionService transactions(repo_, currency_, RetryPolicy{}, [](std::chrono::milliseconds) {});

    domain::TransactionRequest req;
    req.walletId = wallet.id;
    req.externalId = "dep";
    req.kind = domain::TransactionKind::DEPOSIT;
    req.amount = domain::DecimalAmount::fromDouble(2.0, "USD");
    transactions.applyTransaction(req);

    req.externalId = "wd";
    req.kind = domain::TransactionKind::WITHDRAWAL;
    req.amount = domain::DecimalAmount::fromDouble(30.0, "EGP");
    transactions.applyTransaction(req);

    auto report = service_->reconcile(wallet.id);

    EXPECT_TRUE(report.consistent);
    EXPECT_EQ(report.storedBalance.minor, 5000 + 9800 - 3000);
}

TEST_F(ConsistencyServiceTest, UnknownWallet_Throws) {
    EXPECT_THROW(service_->checkConsistency("missing"), domain::WalletNotFoundException);
}

TEST_F(ConsistencyServiceTest, StoredBalanceDrifted_Inconsistent) {
    auto mockRepo = std::make_shared<tests::MockLedgerRepository>();
    ConsistencyService service(mockRepo);

    domain::Wallet wallet;
    wallet.id = "w-drift";
    wallet.balance = domain::Money::fromMinor(10050);

    EXPECT_CALL(*mockRepo, findWalletById("w-drift")).WillOnce(Return(wallet));
    EXPECT_CALL(*mockRepo, sumAppliedAmountsForWallet("w-drift"))
        .WillOnce(Return(domain::Money::fromMinor(10000)));

    auto report = service.reconcile("w-drift");

    EXPECT_FALSE(report.consistent);
    EXPECT_EQ(report.difference.minor, 50);
}

TEST_F(ConsistencyServiceTest, OneMinorUnitDifference_Inconsistent) {
    auto mockRepo = std::make_shared<tests::MockLedgerRepository>();
    ConsistencyService service(mockRepo);

    domain::Wallet wallet;
    wallet.id = "w-cent";
    wallet.balance = domain::Money::fromMinor(100);

    EXPECT_CALL(*mockRepo, findWalletById("w-cent")).WillOnce(Return(wallet));
    EXPECT_CALL(*mockRepo, sumAppliedAmountsForWallet("w-cent"))
        .WillOnce(Return(domain::Money::fromMinor(101)));

    EXPECT_FALSE(service.checkConsistency("w-cent"));
}
