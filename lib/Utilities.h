#ifndef PAISA_UTILITIES_H
#define PAISA_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paisa {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_DAY = 24 * 3600 * MS_PER_SECOND;

/**
 * Current wall-clock time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

bool parseInt64(const std::string &str, int64_t &value);
bool parseUInt64(const std::string &str, uint64_t &value);

std::string toLower(const std::string &str);

/**
 * Case-insensitive (ASCII) substring test
 */
bool containsIgnoreCase(const std::string &haystack, const std::string &needle);

std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Render minor units as a major-unit decimal string, e.g. 50025 -> "500.25"
 */
std::string formatAmount(int64_t minorUnits);

/**
 * Parse a major-unit decimal string ("500", "500.5", "500.25") into minor
 * units. At most two fractional digits are accepted.
 * @return false on malformed input or overflow
 */
bool parseAmount(const std::string &str, int64_t &minorUnits);

/**
 * UTC calendar date of a millisecond timestamp as "YYYY-MM-DD"
 */
std::string formatDate(int64_t timestampMs);

/**
 * UTC timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string formatTimestamp(int64_t timestampMs);

/**
 * Milliseconds since the epoch of 00:00:00 UTC on the given civil date.
 * Month is 1-based; day may run past the month end (it is normalised).
 */
int64_t utcMidnightMs(int year, int month, int day);

/**
 * First and last millisecond of a calendar month in UTC
 * @return false if month is outside 1..12
 */
bool monthRangeMs(int year, int month, int64_t &startMs, int64_t &endMs);

std::string toBase36(uint64_t value);

/**
 * Random string drawn uniformly from the given alphabet (libsodium)
 */
std::string randomString(size_t length, const std::string &alphabet);

/**
 * Load and parse a JSON file
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write JSON to path via a temporary file and rename, so readers never see a
 * half-written file
 */
Roe<void> saveJsonFile(const std::string &path, const nlohmann::json &json);

} // namespace utl
} // namespace paisa

#endif // PAISA_UTILITIES_H
