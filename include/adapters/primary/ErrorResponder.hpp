#pragma once

#include <IResponse.hpp>
#include "domain/exceptions/WalletException.hpp"
#include "domain/exceptions/InsufficientFundsException.hpp"
#include "domain/exceptions/WalletNotFoundException.hpp"
#include "domain/exceptions/UnsupportedCurrencyException.hpp"
#include "domain/exceptions/ConcurrencyExhaustedException.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wallet::adapters::primary {

/**
 * @brief Отображение доменных ошибок в HTTP ответы
 *
 * | Ошибка                 | Статус |
 * |------------------------|--------|
 * | VALIDATION_ERROR       | 400    |
 * | UNSUPPORTED_CURRENCY   | 400    |
 * | INSUFFICIENT_FUNDS     | 400    |
 * | WALLET_NOT_FOUND       | 404    |
 * | CONCURRENCY_EXHAUSTED  | 503    |
 * | прочее                 | 500    |
 *
 * Тело: {"error": CODE, "message": "...", "details": {...}}
 */
class ErrorResponder {
public:
    static void send(IResponse& res, int status, const std::string& code, const std::string& message,
                     const nlohmann::json& details = nullptr)
    {
        nlohmann::json error;
        error["error"] = code;
        error["message"] = message;
        if (!details.is_null()) {
            error["details"] = details;
        }
        res.setResult(status, "application/json", error.dump());
    }

    static void send(IResponse& res, const domain::WalletException& e) {
        send(res, statusFor(e), e.code(), e.what(), detailsFor(e));
    }

    static int statusFor(const domain::WalletException& e) {
        if (dynamic_cast<const domain::WalletNotFoundException*>(&e)) return 404;
        if (dynamic_cast<const domain::ConcurrencyExhaustedException*>(&e)) return 503;
        return 400;
    }

private:
    static nlohmann::json detailsFor(const domain::WalletException& e) {
        if (auto* funds = dynamic_cast<const domain::InsufficientFundsException*>(&e)) {
            return {
                {"current_balance", funds->currentBalance().toDouble()},
                {"requested_amount", funds->requestedAmount().toDouble()},
                {"shortfall", funds->shortfall().toDouble()}};
        }
        if (auto* notFound = dynamic_cast<const domain::WalletNotFoundException*>(&e)) {
            return {{"wallet_id", notFound->walletId()}};
        }
        if (auto* currency = dynamic_cast<const domain::UnsupportedCurrencyException*>(&e)) {
            return {{"currency", currency->currency()}};
        }
        if (auto* exhausted = dynamic_cast<const domain::ConcurrencyExhaustedException*>(&e)) {
            return {
                {"wallet_id", exhausted->walletId()},
                {"transaction_id", exhausted->externalId()},
                {"attempts", exhausted->attempts()}};
        }
        return nullptr;
    }
};

} // namespace wallet::adapters::primary
