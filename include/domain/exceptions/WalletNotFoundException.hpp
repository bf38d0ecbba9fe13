#pragma once

#include "WalletException.hpp"
#include <string>

namespace wallet::domain {

class WalletNotFoundException : public WalletException {
public:
    explicit WalletNotFoundException(const std::string& walletId)
        : WalletException("WALLET_NOT_FOUND", "Wallet with ID " + walletId + " not found")
        , walletId_(walletId) {}

    const std::string& walletId() const noexcept { return walletId_; }

private:
    std::string walletId_;
};

} // namespace wallet::domain
