#pragma once

#include <cstdlib>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace wallet::settings {

/**
 * @brief Настройки движка транзакций
 *
 * Читает из ENV:
 * - WALLET_REFERENCE_CURRENCY (default: EGP)
 * - WALLET_RETRY_MAX_ATTEMPTS (default: 3, 1..10)
 * - WALLET_RETRY_BASE_DELAY_MS (default: 100, 0..10000)
 * - WALLET_STORAGE (default: postgres; memory: без БД, для локального запуска)
 */
class LedgerSettings {
public:
    static constexpr int kMaxAttemptsLimit = 10;
    static constexpr int kMaxBaseDelayMs = 10000;

    LedgerSettings() {
        if (const char* val = std::getenv("WALLET_REFERENCE_CURRENCY")) {
            referenceCurrency_ = val;
            std::transform(referenceCurrency_.begin(), referenceCurrency_.end(),
                           referenceCurrency_.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        }
        if (const char* val = std::getenv("WALLET_RETRY_MAX_ATTEMPTS")) {
            maxAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WALLET_RETRY_BASE_DELAY_MS")) {
            baseDelayMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WALLET_STORAGE")) {
            storage_ = val;
        }

        if (maxAttempts_ < 1 || maxAttempts_ > kMaxAttemptsLimit) {
            throw std::invalid_argument("WALLET_RETRY_MAX_ATTEMPTS must be in [1, 10]");
        }
        if (baseDelayMs_ < 0 || baseDelayMs_ > kMaxBaseDelayMs) {
            throw std::invalid_argument("WALLET_RETRY_BASE_DELAY_MS must be in [0, 10000]");
        }
        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::invalid_argument("WALLET_STORAGE must be 'postgres' or 'memory'");
        }
    }

    std::string getReferenceCurrency() const { return referenceCurrency_; }
    int getMaxAttempts() const { return maxAttempts_; }
    int getBaseDelayMs() const { return baseDelayMs_; }
    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }

private:
    std::string referenceCurrency_ = "EGP";
    int maxAttempts_ = 3;
    int baseDelayMs_ = 100;
    std::string storage_ = "postgres";
};

} // namespace wallet::settings
