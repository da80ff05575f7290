#pragma once
#include <boost/date_time/posix_time/posix_time.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <string>

#include "Errors.hpp"

namespace tsched {

// Время задач: секунды от epoch (double), как в файле снапшота
using EpochSeconds = double;

// 9999-12-31T23:59:59Z: дальше ISO-форматирование невозможно
constexpr EpochSeconds kMaxEpochSeconds = 253402300799.0;

inline EpochSeconds nowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

namespace detail {
inline const boost::posix_time::ptime& epoch() {
    static const boost::posix_time::ptime e(boost::gregorian::date(1970, 1, 1));
    return e;
}

// "+05:30" / "-0200" -> секунды смещения
inline long parseUtcOffset(const std::string& s) {
    std::string digits;
    for (char c : s.substr(1))
        if (c != ':') digits += c;
    if (digits.size() != 4 && digits.size() != 2)
        throw ValidationError("Invalid UTC offset: " + s);
    for (char c : digits)
        if (c < '0' || c > '9') throw ValidationError("Invalid UTC offset: " + s);
    long hh = std::stol(digits.substr(0, 2));
    long mm = digits.size() == 4 ? std::stol(digits.substr(2, 2)) : 0;
    if (hh > 23 || mm > 59) throw ValidationError("Invalid UTC offset: " + s);
    long off = hh * 3600 + mm * 60;
    return s[0] == '-' ? -off : off;
}

// Локальное время (текущая TZ процесса) -> epoch
inline EpochSeconds localToEpoch(const boost::posix_time::ptime& t) {
    std::tm tm = boost::posix_time::to_tm(t);
    tm.tm_isdst = -1;
    const std::time_t tt = std::mktime(&tm);
    if (tt == (std::time_t)-1)
        throw ValidationError("Timestamp is outside the local time range");
    const auto frac = t.time_of_day().fractional_seconds();
    return (double)tt + (double)frac / (double)boost::posix_time::time_duration::ticks_per_second();
}
} // namespace detail

// ISO-8601: "2026-03-01T10:00:00", "2026-03-01 10:00:00.250", "...Z", "...+02:00", "2026-03-01".
// Без зоны: локальное время процесса.
inline EpochSeconds parseIsoTimestamp(std::string s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
    while (!s.empty() && s.front() == ' ') s.erase(s.begin());
    if (s.size() < 10) throw ValidationError("Invalid timestamp: '" + s + "'");

    long offset = 0;
    bool zoned = false;
    if (s.back() == 'Z' || s.back() == 'z') {
        s.pop_back();
        zoned = true;
    } else if (s.size() > 10) {
        auto pos = s.find_last_of("+-");
        // '-' внутри даты (позиции 4 и 7): не зона
        if (pos != std::string::npos && pos > 10) {
            offset = detail::parseUtcOffset(s.substr(pos));
            s.erase(pos);
            zoned = true;
        }
    }

    if (s.size() == 10) s += "T00:00:00";
    if (s.size() > 10 && s[10] == ' ') s[10] = 'T';

    boost::posix_time::ptime t;
    try {
        t = boost::posix_time::from_iso_extended_string(s);
    } catch (const std::exception& e) {
        throw ValidationError("Invalid timestamp: '" + s + "' (" + e.what() + ")");
    }
    if (t.is_not_a_date_time() || t.is_special())
        throw ValidationError("Invalid timestamp: '" + s + "'");

    if (!zoned) return detail::localToEpoch(t);

    auto since = t - detail::epoch();
    return (double)since.total_microseconds() / 1e6 - (double)offset;
}

// UTC, микросекунды, суффикс Z. Не бросает: вне диапазона -> "invalid"
inline std::string formatIsoTimestamp(EpochSeconds t) {
    if (!std::isfinite(t) || t < 0 || t > kMaxEpochSeconds) return "invalid";
    try {
        auto us = (std::int64_t)std::llround(t * 1e6);
        boost::posix_time::ptime p = detail::epoch() + boost::posix_time::microseconds(us);
        return boost::posix_time::to_iso_extended_string(p) + "Z";
    } catch (const std::exception&) {
        return "invalid";
    }
}

} // namespace tsched
