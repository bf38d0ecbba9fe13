/**
 * @file CreateWalletHandlerTest.cpp
 * @brief Unit-тесты для CreateWalletHandler
 *
 * POST /api/v1/wallets: создать кошелёк
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CreateWalletHandler.hpp"
#include "mocks/MockServices.hpp"
#include "domain/exceptions/InvalidRequestException.hpp"
#include "domain/exceptions/UnsupportedCurrencyException.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace wallet;
using namespace wallet::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class CreateWalletHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<tests::MockWalletService>();
        handler_ = std::make_unique<CreateWalletHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string &method, const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/v1/wallets");
        req.setBody(body);
        return req;
    }

    domain::Wallet createWallet(int64_t minor)
    {
        domain::Wallet wallet;
        wallet.id = "w-new";
        wallet.balance = domain::Money::fromMinor(minor);
        wallet.currency = "EGP";
        return wallet;
    }

    std::shared_ptr<tests::MockWalletService> mockService_;
    std::unique_ptr<CreateWalletHandler> handler_;
};

TEST_F(CreateWalletHandlerTest, WithInitialBalance_Returns201)
{
    EXPECT_CALL(*mockService_, createWallet(domain::Money::fromMinor(100000, ""), "EGP"))
        .WillOnce(Return(createWallet(100000)));

    auto req = createRequest("POST", R"({"initial_balance": 1000, "currency": "EGP"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["id"], "w-new");
    EXPECT_DOUBLE_EQ(json["balance"].get<double>(), 1000.0);
    EXPECT_EQ(json["currency"], "EGP");
}

TEST_F(CreateWalletHandlerTest, EmptyBody_CreatesZeroWallet)
{
    EXPECT_CALL(*mockService_, createWallet(_, ""))
        .WillOnce(Return(createWallet(0)));

    auto req = createRequest("POST");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
}

TEST_F(CreateWalletHandlerTest, NegativeBalance_Returns400)
{
    EXPECT_CALL(*mockService_, createWallet(_, _))
        .WillOnce(Throw(domain::InvalidRequestException("initialBalance must not be negative")));

    auto req = createRequest("POST", R"({"initial_balance": -5})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "VALIDATION_ERROR");
}

TEST_F(CreateWalletHandlerTest, UnknownCurrency_Returns400)
{
    EXPECT_CALL(*mockService_, createWallet(_, "TOOLONGCODE"))
        .WillOnce(Throw(domain::UnsupportedCurrencyException("TOOLONGCODE")));

    auto req = createRequest("POST", R"({"initial_balance": 0, "currency": "TOOLONGCODE"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "UNSUPPORTED_CURRENCY");
}

TEST_F(CreateWalletHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*mockService_, createWallet(_, _)).Times(0);

    auto req = createRequest("POST", "[broken");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(CreateWalletHandlerTest, WrongMethod_Returns405)
{
    auto req = createRequest("DELETE");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
