#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransactionService.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::primary
{

    /**
     * @brief POST /api/v1/transactions: провести депозит или списание
     *
     * Тело запроса:
     * {
     *   "transaction_id": "tx-001",     // ключ идемпотентности
     *   "wallet_id": "...",
     *   "type": "DEPOSIT" | "WITHDRAWAL",
     *   "amount": 10.5,                 // >= 0.01, до 8 знаков
     *   "currency": "USD",              // опционально, по умолчанию опорная
     *   "metadata": {...}               // опционально
     * }
     *
     * Повтор с тем же transaction_id возвращает ту же запись (201).
     */
    class CreateTransactionHandler : public IHttpHandler
    {
    public:
        explicit CreateTransactionHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[CreateTransactionHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                ErrorResponder::send(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            domain::TransactionRequest request;
            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                request.externalId = body.value("transaction_id", "");
                request.walletId = body.value("wallet_id", "");

                auto kind = domain::parseTransactionKind(body.value("type", ""));
                if (!kind)
                {
                    ErrorResponder::send(res, 400, "VALIDATION_ERROR", "type must be DEPOSIT or WITHDRAWAL");
                    return;
                }
                request.kind = *kind;

                if (!body.contains("amount"))
                {
                    ErrorResponder::send(res, 400, "VALIDATION_ERROR", "amount is required");
                    return;
                }
                request.amount = json::parseDecimal(body["amount"], body.value("currency", ""));

                if (body.contains("metadata"))
                {
                    request.metadata = body["metadata"];
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                ErrorResponder::send(res, 400, "VALIDATION_ERROR", "Invalid JSON");
                return;
            }
            catch (const std::invalid_argument &e)
            {
                ErrorResponder::send(res, 400, "VALIDATION_ERROR", e.what());
                return;
            }
            catch (const std::out_of_range &e)
            {
                ErrorResponder::send(res, 400, "VALIDATION_ERROR", e.what());
                return;
            }

            try
            {
                auto entry = transactionService_->applyTransaction(request);
                res.setResult(201, "application/json", json::toJson(entry).dump());
            }
            catch (const domain::WalletException &e)
            {
                ErrorResponder::send(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateTransactionHandler] Error: " << e.what() << std::endl;
                ErrorResponder::send(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace wallet::adapters::primary
