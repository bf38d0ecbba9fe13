#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IWalletService.hpp"
#include "ports/input/IConsistencyService.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::primary {

/**
 * @brief HTTP Handler для чтения состояния кошелька
 *
 * Endpoints:
 * - GET /api/v1/wallets/{id}/balance      → текущий баланс
 * - GET /api/v1/wallets/{id}/transactions → история, новые первыми
 * - GET /api/v1/wallets/{id}/consistency  → сверка баланса с журналом
 */
class WalletQueryHandler : public IHttpHandler
{
public:
    WalletQueryHandler(
        std::shared_ptr<ports::input::IWalletService> walletService,
        std::shared_ptr<ports::input::IConsistencyService> consistencyService
    ) : walletService_(std::move(walletService))
      , consistencyService_(std::move(consistencyService))
    {
        std::cout << "[WalletQueryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        if (req.getMethod() != "GET") {
            ErrorResponder::send(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        std::string walletId;
        std::string resource;
        if (!parsePath(extractPath(req.getPath()), walletId, resource)) {
            ErrorResponder::send(res, 404, "NOT_FOUND", "Not found");
            return;
        }

        try {
            if (resource == "balance") {
                auto snapshot = walletService_->getBalance(walletId);
                res.setResult(200, "application/json", json::toJson(snapshot).dump());
            } else if (resource == "transactions") {
                auto entries = walletService_->getTransactionHistory(walletId);
                nlohmann::json response = nlohmann::json::array();
                for (const auto& entry : entries) {
                    response.push_back(json::toJson(entry));
                }
                res.setResult(200, "application/json", response.dump());
            } else if (resource == "consistency") {
                auto report = consistencyService_->reconcile(walletId);
                res.setResult(200, "application/json", json::toJson(report).dump());
            } else {
                ErrorResponder::send(res, 404, "NOT_FOUND", "Not found");
            }
        } catch (const domain::WalletException& e) {
            ErrorResponder::send(res, e);
        } catch (const std::exception& e) {
            std::cerr << "[WalletQueryHandler] Error: " << e.what() << std::endl;
            ErrorResponder::send(res, 500, "INTERNAL_ERROR", "Internal server error");
        }
    }

private:
    static constexpr const char* kPrefix = "/api/v1/wallets/";

    std::shared_ptr<ports::input::IWalletService> walletService_;
    std::shared_ptr<ports::input::IConsistencyService> consistencyService_;

    /**
     * @brief Извлекает путь без query string
     */
    static std::string extractPath(const std::string& fullPath)
    {
        size_t pos = fullPath.find('?');
        return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
    }

    /**
     * @brief /api/v1/wallets/{id}/{resource} → id, resource
     */
    static bool parsePath(const std::string& path, std::string& walletId, std::string& resource)
    {
        const std::string prefix = kPrefix;
        if (path.compare(0, prefix.size(), prefix) != 0) {
            return false;
        }
        std::string rest = path.substr(prefix.size());
        size_t slash = rest.find('/');
        if (slash == std::string::npos || slash == 0) {
            return false;
        }
        walletId = rest.substr(0, slash);
        resource = rest.substr(slash + 1);
        if (!resource.empty() && resource.back() == '/') {
            resource.pop_back();
        }
        return !resource.empty();
    }
};

} // namespace wallet::adapters::primary
