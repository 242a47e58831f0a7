/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Conversion between OpenSSL ASN1_TIME and std::chrono, RFC 3339
 * formatting/parsing, and duration strings such as "8760h" or "1h30m".
 */

#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <optional>
#include <openssl/asn1.h>

namespace pkiforge {
namespace utils {

/// UTC instant with whole-second resolution; spans the full time_t range
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// Latest representable certificate time, 9999-12-31T23:59:59Z (RFC 5280 GeneralizedTime)
constexpr std::time_t kMaxCertificateTime = 253402300799;

inline TimePoint fromTimeT(std::time_t t) {
    return TimePoint(std::chrono::seconds(t));
}

inline std::time_t toTimeT(const TimePoint& tp) {
    return static_cast<std::time_t>(tp.time_since_epoch().count());
}

/**
 * @brief Current wall-clock time, truncated to whole seconds
 */
TimePoint currentTime();

/**
 * @brief tp + duration, range-checked
 * @return std::nullopt if the result is past kMaxCertificateTime
 */
std::optional<TimePoint> addDuration(const TimePoint& tp, std::chrono::seconds duration);

/**
 * @brief Convert ASN1_TIME to TimePoint
 *
 * @param asn1Time OpenSSL ASN1_TIME structure
 * @return time_point, or std::nullopt if asn1Time is null or malformed
 */
std::optional<TimePoint> asn1TimeToTimePoint(
    const ASN1_TIME* asn1Time
);

/**
 * @brief Convert time_point to ASN1_TIME
 *
 * UTCTime is used up to 2049, GeneralizedTime afterwards (RFC 5280 4.1.2.5).
 *
 * @return ASN1_TIME (caller must free with ASN1_TIME_free), or nullptr on error
 */
ASN1_TIME* timePointToAsn1Time(
    const TimePoint& tp
);

/**
 * @brief Format TimePoint as ISO 8601 / RFC 3339 UTC string
 *
 * @return e.g. "2026-02-02T12:34:56Z"
 */
std::string formatIso8601(
    const TimePoint& tp
);

/**
 * @brief Parse RFC 3339 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds followed by
 * "Z" or a numeric offset ("+09:00"). The result is normalized to UTC.
 *
 * @return TimePoint, or std::nullopt on error or past kMaxCertificateTime
 */
std::optional<TimePoint> parseIso8601(
    const std::string& text
);

/**
 * @brief Parse duration string
 *
 * A sequence of decimal numbers each with a unit suffix: "ns", "us", "ms",
 * "s", "m", "h". Examples: "8760h", "1h30m", "1.5h", "90s".
 * Sub-second remainders are truncated.
 *
 * @return Duration in seconds, or std::nullopt if malformed, negative or
 *         longer than kMaxCertificateTime seconds
 */
std::optional<std::chrono::seconds> parseDuration(const std::string& text);

} // namespace utils
} // namespace pkiforge
