#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Денежная сумма с фиксированной точкой (2 знака после запятой)
 *
 * Хранится как целое число минимальных единиц (пиастры, центы) в int64_t,
 * поэтому сложение, вычитание и сравнение точны.
 *
 * Округление при создании из double/строки: half-up (от нуля) до 0.01.
 *
 * Пример: 265.50 EGP = {minor: 26550, currency: "EGP"}
 */
struct Money {
    static constexpr int64_t kScale = 100;  ///< Минимальных единиц в одной основной

    int64_t minor = 0;              ///< Сумма в минимальных единицах (может быть < 0)
    std::string currency = "EGP";   ///< Код валюты (ISO 4217)

    Money() = default;

    Money(int64_t minorUnits, const std::string& curr)
        : minor(minorUnits), currency(curr) {}

    static Money fromMinor(int64_t minorUnits, const std::string& curr = "EGP") {
        return Money(minorUnits, curr);
    }

    /**
     * @brief Создать Money из double с округлением half-up
     */
    static Money fromDouble(double value, const std::string& curr = "EGP") {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Amount is not a finite number");
        }
        // std::llround округляет половину от нуля
        return Money(static_cast<int64_t>(std::llround(value * kScale)), curr);
    }

    /**
     * @brief Разобрать десятичную строку ("12", "-3.5", "0.015")
     *
     * Лишние знаки после второго округляются half-up.
     */
    static Money fromString(const std::string& text, const std::string& curr = "EGP") {
        if (text.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool roundUp = false;
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
            int digit = c - '0';
            if (!seenPoint) {
                if (whole > (INT64_MAX / kScale - 9) / 10) {
                    throw std::out_of_range("Amount is too large: " + text);
                }
                whole = whole * 10 + digit;
            } else if (fractionDigits < 2) {
                fraction = fraction * 10 + digit;
                ++fractionDigits;
            } else if (fractionDigits == 2) {
                roundUp = digit >= 5;
                ++fractionDigits;
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid amount: " + text);
        }
        while (fractionDigits < 2) {
            fraction *= 10;
            ++fractionDigits;
        }

        int64_t value = whole * kScale + fraction + (roundUp ? 1 : 0);
        return Money(negative ? -value : value, curr);
    }

    double toDouble() const {
        return static_cast<double>(minor) / static_cast<double>(kScale);
    }

    /**
     * @brief Строка с двумя знаками после запятой: "490.00", "-15.50"
     */
    std::string toString() const {
        int64_t absMinor = std::llabs(minor);
        std::string fraction = std::to_string(absMinor % kScale);
        if (fraction.size() < 2) {
            fraction.insert(0, 2 - fraction.size(), '0');
        }
        return (minor < 0 ? "-" : "") + std::to_string(absMinor / kScale) + "." + fraction;
    }

    /// @throws std::overflow_error если сумма не помещается в int64
    Money operator+(const Money& other) const {
        int64_t result = 0;
        if (__builtin_add_overflow(minor, other.minor, &result)) {
            throw std::overflow_error("Money overflow: " + toString() + " + " + other.toString());
        }
        return Money(result, currency);
    }

    Money operator-(const Money& other) const {
        int64_t result = 0;
        if (__builtin_sub_overflow(minor, other.minor, &result)) {
            throw std::overflow_error("Money overflow: " + toString() + " - " + other.toString());
        }
        return Money(result, currency);
    }

    Money operator-() const {
        return Money(-minor, currency);
    }

    Money abs() const {
        return Money(std::llabs(minor), currency);
    }

    bool operator==(const Money& other) const {
        return minor == other.minor && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    bool operator<(const Money& other) const { return minor < other.minor; }
    bool operator>(const Money& other) const { return other < *this; }
    bool operator<=(const Money& other) const { return !(other < *this); }
    bool operator>=(const Money& other) const { return !(*this < other); }

    bool isZero() const { return minor == 0; }
    bool isNegative() const { return minor < 0; }
    bool isPositive() const { return minor > 0; }
};

} // namespace wallet::domain
