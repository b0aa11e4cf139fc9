#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sodium.h>
#include <stdexcept>

namespace paisa {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool parseInt64(const std::string &str, int64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

std::string toLower(const std::string &str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool containsIgnoreCase(const std::string &haystack, const std::string &needle) {
  if (needle.empty()) {
    return true;
  }
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                        });
  return it != haystack.end();
}

std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0) {
      result += delimiter;
    }
    result += strings[i];
  }
  return result;
}

std::string formatAmount(int64_t minorUnits) {
  bool negative = minorUnits < 0;
  // Work in unsigned space so INT64_MIN does not overflow on negation
  uint64_t magnitude = negative ? uint64_t(0) - static_cast<uint64_t>(minorUnits)
                                : static_cast<uint64_t>(minorUnits);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%llu.%02llu", negative ? "-" : "",
                static_cast<unsigned long long>(magnitude / 100),
                static_cast<unsigned long long>(magnitude % 100));
  return std::string(buf);
}

bool parseAmount(const std::string &str, int64_t &minorUnits) {
  if (str.empty()) {
    return false;
  }
  size_t dot = str.find('.');
  std::string whole = str.substr(0, dot);
  std::string frac = dot == std::string::npos ? "" : str.substr(dot + 1);
  if (whole.empty() || frac.size() > 2 || (dot != std::string::npos && frac.empty())) {
    return false;
  }
  auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
  if (!std::all_of(whole.begin(), whole.end(), isDigit) ||
      !std::all_of(frac.begin(), frac.end(), isDigit)) {
    return false;
  }

  int64_t units = 0;
  if (!parseInt64(whole, units)) {
    return false;
  }
  int64_t cents = 0;
  if (!frac.empty()) {
    while (frac.size() < 2) {
      frac += '0';
    }
    if (!parseInt64(frac, cents)) {
      return false;
    }
  }
  constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
  if (units > MAX / 100 || units * 100 > MAX - cents) {
    return false;
  }
  minorUnits = units * 100 + cents;
  return true;
}

static std::tm toUtc(int64_t timestampMs) {
  // Floor division keeps pre-epoch timestamps on the right calendar day
  int64_t seconds = timestampMs / MS_PER_SECOND;
  if (timestampMs % MS_PER_SECOND < 0) {
    --seconds;
  }
  time_t t = static_cast<time_t>(seconds);
  std::tm utc{};
  gmtime_r(&t, &utc);
  return utc;
}

std::string formatDate(int64_t timestampMs) {
  std::tm utc = toUtc(timestampMs);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &utc);
  return std::string(buf);
}

std::string formatTimestamp(int64_t timestampMs) {
  std::tm utc = toUtc(timestampMs);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  int64_t ms = timestampMs % MS_PER_SECOND;
  if (ms < 0) {
    ms += MS_PER_SECOND;
  }
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return std::string(out);
}

int64_t utcMidnightMs(int year, int month, int day) {
  // Days from civil (proleptic Gregorian), month normalised into 1..12
  int64_t y = year + (month - 1) / 12;
  int64_t m = (month - 1) % 12 + 1;
  if (m <= 0) {
    m += 12;
    --y;
  }
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t mp = (m + 9) % 12;
  const int64_t doy = (153 * mp + 2) / 5 + 1 - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const int64_t days = era * 146097 + doe - 719468 + (day - 1);
  return days * MS_PER_DAY;
}

bool monthRangeMs(int year, int month, int64_t &startMs, int64_t &endMs) {
  if (month < 1 || month > 12) {
    return false;
  }
  startMs = utcMidnightMs(year, month, 1);
  endMs = utcMidnightMs(year, month + 1, 1) - 1;
  return true;
}

std::string toBase36(uint64_t value) {
  static const char digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(digits[value % 36]);
    value /= 36;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string randomString(size_t length, const std::string &alphabet) {
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(alphabet[randombytes_uniform(
        static_cast<uint32_t>(alphabet.size()))]);
  }
  return out;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
  return json;
}

Roe<void> saveJsonFile(const std::string &path, const nlohmann::json &json) {
  std::string tmpPath = path + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::trunc);
    if (!out.is_open()) {
      return Error(4, "Failed to open file for writing: " + tmpPath);
    }
    out << json.dump(2) << std::endl;
    if (!out) {
      return Error(5, "Failed to write file: " + tmpPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, path, ec);
  if (ec) {
    return Error(6, "Failed to replace " + path + ": " + ec.message());
  }
  return {};
}

} // namespace utl
} // namespace paisa
