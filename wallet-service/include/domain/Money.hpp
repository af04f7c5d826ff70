#pragma once

#include <string>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Денежная сумма в фиксированной точке
 *
 * Хранится как целое число минимальных единиц (центов) - никаких double.
 * Строковое представление "12.34" используется в JSON и сообщениях.
 *
 * Пример: $265.50 = {cents: 26550, currency: "USD"}
 */
struct Money {
    int64_t cents = 0;              ///< Сумма в центах (может быть отрицательной для дельт)
    std::string currency = "USD";   ///< Код валюты (ISO 4217)

    Money() = default;

    explicit Money(int64_t c, const std::string& curr = "USD")
        : cents(c), currency(curr) {}

    /**
     * @brief Разобрать десятичную строку ("12", "12.3", "-0.05")
     * @throws std::invalid_argument если строка не является суммой
     *         или содержит больше двух знаков после точки
     */
    static Money parse(const std::string& text, const std::string& curr = "USD") {
        if (text.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        std::size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }

        int64_t units = 0;
        int digits = 0;
        while (pos < text.size() && text[pos] != '.') {
            char c = text[pos++];
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid amount: " + text);
            }
            if (units > (std::numeric_limits<int64_t>::max() / 100 - 9) / 10) {
                throw std::invalid_argument("Amount out of range: " + text);
            }
            units = units * 10 + (c - '0');
            ++digits;
        }

        int64_t fraction = 0;
        int fractionDigits = 0;
        if (pos < text.size()) {
            ++pos;  // '.'
            while (pos < text.size()) {
                char c = text[pos++];
                if (c < '0' || c > '9' || fractionDigits == 2) {
                    throw std::invalid_argument("Invalid amount: " + text);
                }
                fraction = fraction * 10 + (c - '0');
                ++fractionDigits;
            }
            if (fractionDigits == 0) {
                throw std::invalid_argument("Invalid amount: " + text);
            }
        }

        if (digits == 0 && fractionDigits == 0) {
            throw std::invalid_argument("Invalid amount: " + text);
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        int64_t total = units * 100 + fraction;
        return Money(negative ? -total : total, curr);
    }

    /**
     * @brief Десятичная строка без символа валюты: "-12.05"
     */
    std::string toString() const {
        return decimal(cents);
    }

    /**
     * @brief Строка для пользователя: "$12.05" (USD) или "12.05 EUR"
     */
    std::string format() const {
        return format(cents, currency);
    }

    static std::string format(int64_t amountCents, const std::string& curr = "USD") {
        if (curr == "USD") {
            return amountCents < 0 ? "-$" + decimal(-amountCents) : "$" + decimal(amountCents);
        }
        return decimal(amountCents) + " " + curr;
    }

    Money operator+(const Money& other) const {
        return Money(cents + other.cents, currency);
    }

    Money operator-(const Money& other) const {
        return Money(cents - other.cents, currency);
    }

    Money operator-() const {
        return Money(-cents, currency);
    }

    bool operator==(const Money& other) const {
        return cents == other.cents && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    bool operator<(const Money& other) const { return cents < other.cents; }
    bool operator>(const Money& other) const { return other < *this; }
    bool operator<=(const Money& other) const { return !(other < *this); }
    bool operator>=(const Money& other) const { return !(*this < other); }

    bool isZero() const { return cents == 0; }
    bool isNegative() const { return cents < 0; }
    bool isPositive() const { return cents > 0; }

private:
    static std::string decimal(int64_t amountCents) {
        bool negative = amountCents < 0;
        // -INT64_MIN не помещается в int64_t, считаем в беззнаковом
        uint64_t magnitude = negative
            ? static_cast<uint64_t>(-(amountCents + 1)) + 1
            : static_cast<uint64_t>(amountCents);

        std::string fraction = std::to_string(magnitude % 100);
        if (fraction.size() == 1) {
            fraction = "0" + fraction;
        }
        return (negative ? "-" : "") + std::to_string(magnitude / 100) + "." + fraction;
    }
};

} // namespace wallet::domain
