/*
 * 설명: 시스템 시계와 ISO-8601 변환(UTC 기준)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_codec_test.cpp
 */
#include "voteledger/clock.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace voteledger {
namespace {
// 'd'는 숫자, 나머지는 같은 문자여야 한다.
bool MatchesShape(const std::string& text, std::size_t pos, const char* shape) {
  for (std::size_t i = 0; shape[i] != '\0'; ++i) {
    if (pos + i >= text.size()) {
      return false;
    }
    const unsigned char c = static_cast<unsigned char>(text[pos + i]);
    if (shape[i] == 'd' ? !std::isdigit(c) : c != static_cast<unsigned char>(shape[i])) {
      return false;
    }
  }
  return true;
}

int ReadTwoDigits(const std::string& text, std::size_t pos) { return (text[pos] - '0') * 10 + (text[pos + 1] - '0'); }
}  // namespace

std::int64_t Clock::NowMillis() const {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::string ToIsoString(std::int64_t epoch_millis) {
  std::int64_t seconds = epoch_millis / 1000;
  int millis = static_cast<int>(epoch_millis % 1000);
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }
  const std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::optional<std::int64_t> ParseIsoTimestamp(const std::string& raw) {
  const std::size_t begin = raw.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  const std::size_t end = raw.find_last_not_of(" \t");
  const std::string text = raw.substr(begin, end - begin + 1);

  if (!MatchesShape(text, 0, "dddd-dd-dd")) {
    return std::nullopt;
  }
  std::string normalized = text.substr(0, 10);
  const char* format = "%Y-%m-%d";
  std::size_t pos = 10;
  int millis = 0;
  int offset_minutes = 0;

  if (pos < text.size()) {
    const char separator = text[pos];
    if (separator != 'T' && separator != 't' && separator != ' ') {
      return std::nullopt;
    }
    if (MatchesShape(text, pos + 1, "dd:dd:dd")) {
      normalized += "T" + text.substr(pos + 1, 8);
      format = "%Y-%m-%dT%H:%M:%S";
      pos += 9;
      if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
          if (digits < 3) {
            millis = millis * 10 + (text[pos] - '0');
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) {
          return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
          millis *= 10;
        }
      }
    } else if (MatchesShape(text, pos + 1, "dd:dd")) {
      normalized += "T" + text.substr(pos + 1, 5);
      format = "%Y-%m-%dT%H:%M";
      pos += 6;
    } else {
      return std::nullopt;
    }

    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
      ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      const int sign = text[pos] == '-' ? -1 : 1;
      ++pos;
      if (MatchesShape(text, pos, "dd:dd")) {
        offset_minutes = sign * (ReadTwoDigits(text, pos) * 60 + ReadTwoDigits(text, pos + 3));
        pos += 5;
      } else if (MatchesShape(text, pos, "dddd")) {
        offset_minutes = sign * (ReadTwoDigits(text, pos) * 60 + ReadTwoDigits(text, pos + 2));
        pos += 4;
      } else {
        return std::nullopt;
      }
    }
    if (pos != text.size()) {
      return std::nullopt;
    }
  }

  std::tm tm{};
  std::istringstream iss(normalized);
  iss >> std::get_time(&tm, format);
  if (iss.fail()) {
    return std::nullopt;
  }
  // timegm은 2월 30일 같은 값을 다음 달로 넘기므로 왕복 비교로 걸러낸다.
  const std::tm parsed = tm;
  const std::time_t seconds = timegm(&tm);
  if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon || tm.tm_mday != parsed.tm_mday ||
      tm.tm_hour != parsed.tm_hour || tm.tm_min != parsed.tm_min || tm.tm_sec != parsed.tm_sec) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(seconds) * 1000 + millis - static_cast<std::int64_t>(offset_minutes) * 60'000;
}

}  // namespace voteledger
