#pragma once

#include "WalletException.hpp"
#include <string>

namespace wallet::domain {

class InvalidRequestException : public WalletException {
public:
    explicit InvalidRequestException(const std::string& message)
        : WalletException("VALIDATION_ERROR", message) {}
};

} // namespace wallet::domain
