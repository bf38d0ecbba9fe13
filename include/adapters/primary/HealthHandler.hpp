#pragma once

#include "application/CurrencyService.hpp"

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace wallet::adapters::primary {

/**
 * @brief GET /health
 *
 * Кроме статуса отдаёт опорную валюту и число поддерживаемых валют,
 * чтобы по одному запросу было видно, с какой таблицей курсов поднят сервис.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<application::CurrencyService> currencyService)
        : currencyService_(std::move(currencyService)) {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            res.setResult(405, "application/json", R"({"error": "Method not allowed"})");
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "wallet-service";
        response["reference_currency"] = currencyService_->referenceCurrency();
        response["supported_currencies"] = currencyService_->supportedCurrencies().size();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<application::CurrencyService> currencyService_;
};

} // namespace wallet::adapters::primary
