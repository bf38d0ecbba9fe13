#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "application/CurrencyService.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace wallet::adapters::primary {

/**
 * @brief GET /api/v1/currencies: поддерживаемые валюты и опорная валюта
 */
class CurrenciesHandler : public IHttpHandler {
public:
    explicit CurrenciesHandler(std::shared_ptr<application::CurrencyService> currencyService)
        : currencyService_(std::move(currencyService)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["reference_currency"] = currencyService_->referenceCurrency();
        response["currencies"] = currencyService_->supportedCurrencies();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<application::CurrencyService> currencyService_;
};

} // namespace wallet::adapters::primary
