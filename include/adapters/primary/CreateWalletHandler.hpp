#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IWalletService.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::primary
{

    /**
     * @brief POST /api/v1/wallets: создать кошелёк
     *
     * Тело (всё опционально): {"initial_balance": 1000, "currency": "EGP"}
     */
    class CreateWalletHandler : public IHttpHandler
    {
    public:
        explicit CreateWalletHandler(std::shared_ptr<ports::input::IWalletService> walletService)
            : walletService_(std::move(walletService))
        {
            std::cout << "[CreateWalletHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                ErrorResponder::send(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
                return;
            }

            domain::Money initialBalance;
            std::string currency;
            try
            {
                auto body = req.getBody().empty() ? nlohmann::json::object()
                                                  : nlohmann::json::parse(req.getBody());
                currency = body.value("currency", "");
                if (body.contains("initial_balance"))
                {
                    initialBalance = json::parseAmount(body["initial_balance"], "");
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
                auto wallet = walletService_->createWallet(initialBalance, currency);
                res.setResult(201, "application/json", json::toJson(wallet).dump());
            }
            catch (const domain::WalletException &e)
            {
                ErrorResponder::send(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateWalletHandler] Error: " << e.what() << std::endl;
                ErrorResponder::send(res, 500, "INTERNAL_ERROR", "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IWalletService> walletService_;
    };

} // namespace wallet::adapters::primary
