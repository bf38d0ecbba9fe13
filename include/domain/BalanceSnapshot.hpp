#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>

namespace wallet::domain {

struct BalanceSnapshot {
    std::string walletId;
    Money balance;
    std::string currency;
    Timestamp lastUpdatedAt;
};

} // namespace wallet::domain
