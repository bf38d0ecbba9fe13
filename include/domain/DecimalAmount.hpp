#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Сумма клиента без округления до копеек
 *
 * Хранится в единицах 1e-8, как пришла в запросе ("0.333" → 33300000).
 * До двух знаков округляется только при конвертации в опорную валюту.
 * Больше 8 знаков после запятой не принимается.
 */
struct DecimalAmount {
    static constexpr int64_t kScale = 100000000;
    static constexpr int kMaxFractionDigits = 8;

    int64_t units = 0;
    std::string currency;   ///< Пусто → опорная валюта

    DecimalAmount() = default;

    DecimalAmount(int64_t u, const std::string& curr) : units(u), currency(curr) {}

    static DecimalAmount fromMoney(const Money& money) {
        constexpr int64_t factor = kScale / Money::kScale;
        if (std::llabs(money.minor) > INT64_MAX / factor) {
            throw std::out_of_range("Amount is too large: " + money.toString());
        }
        return DecimalAmount(money.minor * factor, money.currency);
    }

    static DecimalAmount fromDouble(double value, const std::string& curr = "") {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Amount is not a finite number");
        }
        const double scaled = value * static_cast<double>(kScale);
        if (std::fabs(scaled) >= 9.2e18) {
            throw std::out_of_range("Amount is too large");
        }
        return DecimalAmount(static_cast<int64_t>(std::llround(scaled)), curr);
    }

    static DecimalAmount fromString(const std::string& text, const std::string& curr = "") {
        size_t pos = 0;
        bool negative = false;
        if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
            negative = text[0] == '-';
            ++pos;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDigit = false;
        bool seenPoint = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.' && !seenPoint) {
                seenPoint = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid amount: " + text);
            }
            seenDigit = true;
            if (!seenPoint) {
                if (whole > (INT64_MAX / kScale - 9) / 10) {
                    throw std::out_of_range("Amount is too large: " + text);
                }
                whole = whole * 10 + (c - '0');
            } else {
                if (++fractionDigits > kMaxFractionDigits) {
                    throw std::invalid_argument("Amount has more than 8 decimal places: " + text);
                }
                fraction = fraction * 10 + (c - '0');
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid amount: " + text);
        }
        for (int i = fractionDigits; i < kMaxFractionDigits; ++i) {
            fraction *= 10;
        }
        if (whole > (INT64_MAX - fraction) / kScale) {
            throw std::out_of_range("Amount is too large: " + text);
        }

        const int64_t value = whole * kScale + fraction;
        return DecimalAmount(negative ? -value : value, curr);
    }

    double toDouble() const {
        return static_cast<double>(units) / static_cast<double>(kScale);
    }

    /**
     * @brief Не меньше двух знаков, хвостовые нули дальше отбрасываются:
     * "10.00", "0.333", "-1.50"
     */
    std::string toString() const {
        const int64_t absUnits = std::llabs(units);
        std::string fraction = std::to_string(absUnits % kScale);
        fraction.insert(0, kMaxFractionDigits - fraction.size(), '0');
        while (fraction.size() > 2 && fraction.back() == '0') {
            fraction.pop_back();
        }
        return (units < 0 ? "-" : "") + std::to_string(absUnits / kScale) + "." + fraction;
    }

    /// Не меньше 0.01
    bool isAtLeastOneMinorUnit() const { return units >= kScale / Money::kScale; }

    bool operator==(const DecimalAmount& other) const {
        return units == other.units && currency == other.currency;
    }
};

} // namespace wallet::domain
