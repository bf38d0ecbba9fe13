#pragma once

#include "ports/output/IRateProvider.hpp"
#include <map>
#include <string>
#include <optional>
#include <vector>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief Фиксированная таблица курсов к EGP
 *
 * | Валюта | Курс |
 * |--------|------|
 * | EGP    | 1.0  |
 * | USD    | 49.0 |
 * | EUR    | 53.0 |
 * | GBP    | 62.0 |
 * | SAR    | 13.0 |
 * | AED    | 13.3 |
 */
class StaticRateTable : public ports::output::IRateProvider {
public:
    StaticRateTable()
        : rates_{
            {"EGP", 1.0},
            {"USD", 49.0},
            {"EUR", 53.0},
            {"GBP", 62.0},
            {"SAR", 13.0},
            {"AED", 13.3}}
    {
        std::cout << "[StaticRateTable] Loaded " << rates_.size() << " rates" << std::endl;
    }

    std::optional<double> rateOf(const std::string& currency) const override {
        auto it = rates_.find(toUpper(currency));
        if (it == rates_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> supportedCurrencies() const override {
        std::vector<std::string> codes;
        codes.reserve(rates_.size());
        for (const auto& [code, rate] : rates_) {
            codes.push_back(code);
        }
        return codes;
    }

private:
    std::map<std::string, double> rates_;

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
};

} // namespace wallet::adapters::secondary
