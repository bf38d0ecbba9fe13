#pragma once

#include "WalletException.hpp"
#include <string>

namespace wallet::domain {

class UnsupportedCurrencyException : public WalletException {
public:
    explicit UnsupportedCurrencyException(const std::string& currency)
        : WalletException("UNSUPPORTED_CURRENCY", "Unsupported currency: " + currency)
        , currency_(currency) {}

    const std::string& currency() const noexcept { return currency_; }

private:
    std::string currency_;
};

} // namespace wallet::domain
