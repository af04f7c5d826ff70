#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Календарная дата (григорианский календарь, UTC)
 *
 * Используется для дат списаний подписок: due_date, next_billing_date.
 * addMonths прижимает день к концу месяца: 31 января + 1 месяц = 28/29 февраля.
 *
 * Преобразования день ↔ дата - алгоритм days_from_civil (H. Hinnant).
 */
struct Date {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    Date() = default;

    Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
        if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
            throw std::invalid_argument("Invalid date: " + std::to_string(y) + "-" +
                                        std::to_string(m) + "-" + std::to_string(d));
        }
    }

    static bool isLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static unsigned daysInMonth(int y, unsigned m) {
        static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && isLeapYear(y)) ? 29u : days[m - 1];
    }

    /**
     * @brief Количество дней от 1970-01-01
     */
    int64_t toDays() const {
        int y = static_cast<int>(year) - (month <= 2 ? 1 : 0);
        int64_t era = (y >= 0 ? y : y - 399) / 400;
        unsigned yoe = static_cast<unsigned>(y - era * 400);
        unsigned mp = month > 2 ? month - 3 : month + 9;
        unsigned doy = (153 * mp + 2) / 5 + day - 1;
        unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static Date fromDays(int64_t days) {
        days += 719468;
        int64_t era = (days >= 0 ? days : days - 146096) / 146097;
        unsigned doe = static_cast<unsigned>(days - era * 146097);
        unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        int64_t y = static_cast<int64_t>(yoe) + era * 400;
        unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        unsigned mp = (5 * doy + 2) / 153;
        unsigned d = doy - (153 * mp + 2) / 5 + 1;
        unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d);
    }

    static Date fromTimestamp(const Timestamp& ts) {
        int64_t seconds = ts.toUnixSeconds();
        int64_t days = seconds / 86400;
        if (seconds % 86400 < 0) {
            --days;
        }
        return fromDays(days);
    }

    static Date today() {
        return fromTimestamp(Timestamp::now());
    }

    /**
     * @brief Полночь (UTC) этой даты
     */
    Timestamp startOfDay() const {
        return Timestamp::fromUnixMillis(toDays() * 86400LL * 1000LL);
    }

    /**
     * @brief Разобрать "YYYY-MM-DD"
     * @throws std::invalid_argument при неверном формате или несуществующей дате
     */
    static Date parse(const std::string& text) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        char tail = 0;
        if (text.size() != 10 ||
            std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
            throw std::invalid_argument("Invalid date format: " + text);
        }
        return Date(y, m, d);
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return std::string(buf);
    }

    Date addDays(int64_t days) const {
        return fromDays(toDays() + days);
    }

    Date addMonths(int months) const {
        int total = year * 12 + static_cast<int>(month) - 1 + months;
        int y = total / 12;
        unsigned m = static_cast<unsigned>(total % 12) + 1;
        unsigned d = day;
        unsigned last = daysInMonth(y, m);
        return Date(y, m, d > last ? last : d);
    }

    Date addYears(int years) const {
        return addMonths(years * 12);
    }

    Date firstOfMonth() const {
        return Date(year, month, 1);
    }

    bool operator==(const Date& o) const { return toDays() == o.toDays(); }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return toDays() < o.toDays(); }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

} // namespace wallet::domain
