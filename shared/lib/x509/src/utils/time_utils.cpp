/**
 * @file time_utils.cpp
 * @brief Time and ASN.1 conversion utilities implementation
 */

#include "pkiforge/utils/time_utils.h"
#include <cctype>
#include <limits>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pkiforge {
namespace utils {

TimePoint currentTime() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::optional<TimePoint> addDuration(const TimePoint& tp, std::chrono::seconds duration) {
    long long base = tp.time_since_epoch().count();
    long long delta = duration.count();
    if (delta > 0 && base > static_cast<long long>(kMaxCertificateTime) - delta) {
        return std::nullopt;
    }
    if (delta < 0 && base < std::numeric_limits<long long>::min() - delta) {
        return std::nullopt;
    }
    return tp + duration;
}

std::optional<TimePoint> asn1TimeToTimePoint(const ASN1_TIME* asn1Time) {
    if (!asn1Time) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    if (ASN1_TIME_to_tm(asn1Time, &tmTime) != 1) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tmTime);
    if (t == -1) {
        return std::nullopt;
    }
    return fromTimeT(t);
}

ASN1_TIME* timePointToAsn1Time(const TimePoint& tp) {
    std::time_t t = toTimeT(tp);
    return ASN1_TIME_set(nullptr, t);
}

std::string formatIso8601(const TimePoint& tp) {
    std::time_t t = toTimeT(tp);

    struct tm tmTime;
    if (!gmtime_r(&t, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec << 'Z';
    return oss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters
    if (text.size() < 20) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    char sep = 0;
    int consumed = 0;
    int scanned = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                              &tmTime.tm_year, &tmTime.tm_mon, &tmTime.tm_mday, &sep,
                              &tmTime.tm_hour, &tmTime.tm_min, &tmTime.tm_sec, &consumed);
    if (scanned != 7 || consumed != 19 || (sep != 'T' && sep != 't')) {
        return std::nullopt;
    }
    if (tmTime.tm_mon < 1 || tmTime.tm_mon > 12 || tmTime.tm_mday < 1 || tmTime.tm_mday > 31 ||
        tmTime.tm_hour > 23 || tmTime.tm_min > 59 || tmTime.tm_sec > 60) {
        return std::nullopt;
    }

    size_t pos = 19;

    // Fractional seconds are accepted and dropped
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    long offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = (text[pos] == '-') ? -1 : 1;
        int offHour = 0;
        int offMin = 0;
        int offConsumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &offHour, &offMin, &offConsumed) != 2 ||
            offConsumed != 5 || offHour > 23 || offMin > 59) {
            return std::nullopt;
        }
        offsetSeconds = sign * (offHour * 3600L + offMin * 60L);
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    tmTime.tm_year -= 1900;
    tmTime.tm_mon -= 1;
    tmTime.tm_isdst = 0;

    std::time_t t = timegm(&tmTime);
    if (t == -1) {
        return std::nullopt;
    }

    std::time_t utc = t - offsetSeconds;
    if (utc > kMaxCertificateTime) {
        return std::nullopt;
    }
    return fromTimeT(utc);
}

std::optional<std::chrono::seconds> parseDuration(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    if (text[0] == '+') {
        ++pos;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    long double totalSeconds = 0;

    while (pos < text.size()) {
        size_t numberStart = pos;
        bool sawDigit = false;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            sawDigit = sawDigit || std::isdigit(static_cast<unsigned char>(text[pos]));
            ++pos;
        }
        if (!sawDigit) {
            return std::nullopt;
        }

        std::string number = text.substr(numberStart, pos - numberStart);
        long double value = 0;
        try {
            size_t parsed = 0;
            value = std::stold(number, &parsed);
            if (parsed != number.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }

        size_t unitStart = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::string unit = text.substr(unitStart, pos - unitStart);

        long double scale = 0;
        if (unit == "h") {
            scale = 3600;
        } else if (unit == "m") {
            scale = 60;
        } else if (unit == "s") {
            scale = 1;
        } else if (unit == "ms") {
            scale = 1e-3L;
        } else if (unit == "us") {
            scale = 1e-6L;
        } else if (unit == "ns") {
            scale = 1e-9L;
        } else {
            return std::nullopt;
        }

        totalSeconds += value * scale;
        if (!(totalSeconds <= static_cast<long double>(kMaxCertificateTime))) {
            return std::nullopt;
        }
    }

    return std::chrono::seconds(static_cast<long long>(totalSeconds));
}

} // namespace utils
} // namespace pkiforge
