#pragma once

#include <stdexcept>
#include <string>

namespace wallet::domain {

/**
 * @brief Базовое исключение доменных ошибок кошелька
 *
 * code(): стабильный машиночитаемый код ("WALLET_NOT_FOUND", ...),
 * по нему транспортный слой выбирает HTTP статус.
 */
class WalletException : public std::runtime_error {
public:
    WalletException(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

} // namespace wallet::domain
