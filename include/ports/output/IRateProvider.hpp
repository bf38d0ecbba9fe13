#pragma once

#include <string>
#include <optional>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Источник курсов валют относительно опорной единицы
 *
 * Курс: сколько опорных единиц стоит одна единица валюты
 * (EGP = 1.0, USD = 49.0). Курсы не меняются за время жизни процесса.
 */
class IRateProvider {
public:
    virtual ~IRateProvider() = default;

    /**
     * @brief Курс валюты или std::nullopt, если код неизвестен
     */
    virtual std::optional<double> rateOf(const std::string& currency) const = 0;

    virtual std::vector<std::string> supportedCurrencies() const = 0;
};

} // namespace wallet::ports::output
