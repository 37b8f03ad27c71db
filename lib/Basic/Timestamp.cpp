//===-- Timestamp.cpp -----------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "conductor/Basic/Timestamp.h"

#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <ctime>

using namespace conductor;
using namespace conductor::basic;

// Days since 1970-01-01 for a proleptic Gregorian calendar date.
static int64_t daysFromCivil(int64_t year, unsigned month, unsigned day) {
  year -= month <= 2;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yearOfEra = static_cast<unsigned>(year - era * 400);
  const unsigned dayOfYear =
      (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned dayOfEra =
      yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
  return era * 146097 + static_cast<int64_t>(dayOfEra) - 719468;
}

static bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static unsigned daysInMonth(int year, unsigned month) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year))
    return 29;
  return days[month - 1];
}

/// Consume exactly \p count decimal digits from the front of \p text.
static bool consumeDigits(StringRef& text, unsigned count, int& result) {
  if (text.size() < count)
    return false;
  int value = 0;
  for (unsigned i = 0; i != count; ++i) {
    char c = text[i];
    if (c < '0' || c > '9')
      return false;
    value = value * 10 + (c - '0');
  }
  text = text.drop_front(count);
  result = value;
  return true;
}

Timestamp basic::currentTimestamp() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

std::string basic::formatTimestamp(Timestamp value) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(value);
  auto micros = (value - seconds).count();
  std::time_t t = llvm::sys::toTimeT(seconds);

  struct tm parts;
  gmtime_r(&t, &parts);

  std::string result;
  llvm::raw_string_ostream os(result);
  os << llvm::format("%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                     parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                     parts.tm_hour, parts.tm_min, parts.tm_sec,
                     static_cast<long long>(micros));
  os.flush();
  return result;
}

Optional<Timestamp> basic::parseTimestamp(StringRef text) {
  text = text.trim();

  int year, month, day, hour, minute, second;
  if (!consumeDigits(text, 4, year) || !text.consume_front("-") ||
      !consumeDigits(text, 2, month) || !text.consume_front("-") ||
      !consumeDigits(text, 2, day))
    return None;
  if (!text.consume_front("T") && !text.consume_front("t") &&
      !text.consume_front(" "))
    return None;
  if (!consumeDigits(text, 2, hour) || !text.consume_front(":") ||
      !consumeDigits(text, 2, minute) || !text.consume_front(":") ||
      !consumeDigits(text, 2, second))
    return None;

  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) > daysInMonth(year, month))
    return None;
  if (hour > 23 || minute > 59 || second > 60)
    return None;

  // Fractional seconds, truncated to microseconds.
  int64_t micros = 0;
  if (text.consume_front(".") || text.consume_front(",")) {
    unsigned numDigits = 0;
    while (!text.empty() && text.front() >= '0' && text.front() <= '9') {
      if (numDigits < 6)
        micros = micros * 10 + (text.front() - '0');
      ++numDigits;
      text = text.drop_front();
    }
    if (numDigits == 0)
      return None;
    for (; numDigits < 6; ++numDigits)
      micros *= 10;
  }

  // UTC offset.
  int64_t offsetSeconds = 0;
  if (text.consume_front("Z") || text.consume_front("z")) {
    // UTC.
  } else if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    int sign = text.front() == '-' ? -1 : 1;
    text = text.drop_front();
    int offsetHours, offsetMinutes = 0;
    if (!consumeDigits(text, 2, offsetHours))
      return None;
    text.consume_front(":");
    if (!text.empty() && !consumeDigits(text, 2, offsetMinutes))
      return None;
    if (offsetHours > 23 || offsetMinutes > 59)
      return None;
    offsetSeconds = sign * (offsetHours * 3600 + offsetMinutes * 60);
  }
  if (!text.empty())
    return None;

  int64_t days = daysFromCivil(year, month, day);
  int64_t epochSeconds =
      days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
  return Timestamp(std::chrono::microseconds(epochSeconds * 1000000 + micros));
}
