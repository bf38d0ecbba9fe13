#pragma once

#include "ports/output/IRateProvider.hpp"
#include "domain/Money.hpp"
#include "domain/DecimalAmount.hpp"
#include "domain/exceptions/InvalidRequestException.hpp"
#include "domain/exceptions/UnsupportedCurrencyException.hpp"
#include <memory>
#include <string>
#include <vector>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <iostream>

namespace wallet::application {

/**
 * @brief Нормализация сумм в опорную валюту
 *
 * reference = round2(amount × rate[from] / rate[to]), округление half-up,
 * выполняется один раз на этой границе и дальше не повторяется.
 *
 * Расчёт идёт в целых: сумма клиента в единицах 1e-8 без предварительного
 * округления, курсы масштабируются до 1e-4 (13.3 → 133000), поэтому
 * 10 USD → ровно 490.00 EGP, а 0.333 USD → 16.32 EGP.
 */
class CurrencyService {
public:
    static constexpr int64_t kRateScale = 10000;

    CurrencyService(std::shared_ptr<ports::output::IRateProvider> rates,
                    std::string referenceCurrency)
        : rates_(std::move(rates))
        , referenceCurrency_(toUpper(std::move(referenceCurrency)))
    {
        std::cout << "[CurrencyService] Created, reference currency " << referenceCurrency_ << std::endl;
    }

    /**
     * @brief Перевести сумму клиента в опорную валюту
     * @throws UnsupportedCurrencyException если валюта или опорная валюта неизвестна
     * @throws InvalidRequestException если результат не помещается в int64
     */
    domain::Money normalize(const domain::DecimalAmount& amount) const {
        return convertUnits(amount.units, domain::DecimalAmount::kScale,
                            sourceCurrency(amount.currency), referenceCurrency_);
    }

    domain::Money normalize(const domain::Money& amount) const {
        return convert(amount, referenceCurrency_);
    }

    /**
     * @brief Перевести сумму в произвольную поддерживаемую валюту
     */
    domain::Money convert(const domain::Money& amount, const std::string& toCurrency) const {
        return convertUnits(amount.minor, domain::Money::kScale,
                            sourceCurrency(amount.currency), toUpper(toCurrency));
    }

    const std::string& referenceCurrency() const { return referenceCurrency_; }

    std::vector<std::string> supportedCurrencies() const {
        return rates_->supportedCurrencies();
    }

    bool isSupported(const std::string& currency) const {
        return rates_->rateOf(toUpper(currency)).has_value();
    }

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

private:
    std::shared_ptr<ports::output::IRateProvider> rates_;
    std::string referenceCurrency_;

    std::string sourceCurrency(const std::string& currency) const {
        return currency.empty() ? referenceCurrency_ : toUpper(currency);
    }

    int64_t scaledRate(const std::string& currency) const {
        auto rate = rates_->rateOf(currency);
        if (!rate || !(*rate > 0.0)) {
            throw domain::UnsupportedCurrencyException(currency);
        }
        return std::llround(*rate * kRateScale);
    }

    /**
     * @brief units / unitScale в валюте from → минимальные единицы валюты to
     *
     * round_half_up(|units| × rate[from] × 100 / (unitScale × rate[to])),
     * знак сохраняется. Промежуточный результат в 128 битах.
     */
    domain::Money convertUnits(int64_t units, int64_t unitScale,
                               const std::string& from, const std::string& to) const {
        const int64_t fromRate = scaledRate(from);
        const int64_t toRate = scaledRate(to);

        if (from == to && unitScale == domain::Money::kScale) {
            return domain::Money(units, to);
        }

        using Wide = unsigned __int128;
        const Wide magnitude = units < 0 ? Wide(-(units + 1)) + 1 : Wide(units);
        const Wide numerator = magnitude * Wide(fromRate) * Wide(domain::Money::kScale);
        const Wide denominator = Wide(unitScale) * Wide(toRate);

        Wide converted = numerator / denominator;
        if ((numerator % denominator) * 2 >= denominator) {
            ++converted;
        }

        if (converted > Wide(INT64_MAX)) {
            throw domain::InvalidRequestException("amount is too large");
        }

        const int64_t minor = static_cast<int64_t>(converted);
        return domain::Money(units < 0 ? -minor : minor, to);
    }
};

} // namespace wallet::application
