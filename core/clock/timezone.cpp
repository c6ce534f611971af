/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/timezone.hpp"

#include <map>

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/make_shared.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(isched::clock, TimezoneError, e) {
  using E = isched::clock::TimezoneError;
  switch (e) {
    case E::kUnknownTimezone:
      return "TimezoneError: unknown timezone";
    case E::kDatabaseLoadFailed:
      return "TimezoneError: cannot load timezone database";
  }
  return "TimezoneError: unknown error";
}

namespace isched::clock {
  namespace {
    // boost posix_time_zone sign convention: offset is added to UTC
    const std::map<std::string, std::string> kBuiltinZones{
        {"America/New_York", "EST-05EDT,M3.2.0,M11.1.0"},
        {"America/Toronto", "EST-05EDT,M3.2.0,M11.1.0"},
        {"America/Chicago", "CST-06CDT,M3.2.0,M11.1.0"},
        {"America/Denver", "MST-07MDT,M3.2.0,M11.1.0"},
        {"America/Phoenix", "MST-07"},
        {"America/Los_Angeles", "PST-08PDT,M3.2.0,M11.1.0"},
        {"America/Sao_Paulo", "BRT-03"},
        {"Europe/London", "GMT+00BST,M3.5.0/01:00,M10.5.0/02:00"},
        {"Europe/Dublin", "GMT+00IST,M3.5.0/01:00,M10.5.0/02:00"},
        {"Europe/Lisbon", "WET+00WEST,M3.5.0/01:00,M10.5.0/02:00"},
        {"Europe/Amsterdam", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Berlin", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Madrid", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Paris", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Rome", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Warsaw", "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"},
        {"Europe/Kiev", "EET+02EEST,M3.5.0/03:00,M10.5.0/04:00"},
        {"Europe/Moscow", "MSK+03"},
        {"Asia/Dubai", "GST+04"},
        {"Asia/Kolkata", "IST+05:30"},
        {"Asia/Singapore", "SGT+08"},
        {"Asia/Shanghai", "CST+08"},
        {"Asia/Tokyo", "JST+09"},
        {"Australia/Sydney", "AEST+10AEDT,M10.1.0,M4.1.0/03:00"},
    };

    bool isUtcAlias(const std::string &name) {
      return name.empty() || name == "UTC" || name == "GMT" || name == "Z"
             || name == "Etc/UTC" || name == "Etc/GMT";
    }

    outcome::result<TimezonePtr> fromPosixRule(const std::string &rule) {
      try {
        return TimezonePtr{
            boost::make_shared<boost::local_time::posix_time_zone>(rule)};
      } catch (const std::exception &) {
        return TimezoneError::kUnknownTimezone;
      }
    }
  }  // namespace

  outcome::result<void> TimezoneResolver::loadDatabase(
      const std::string &path) {
    try {
      database_.load_from_file(path);
    } catch (const std::exception &) {
      return TimezoneError::kDatabaseLoadFailed;
    }
    return outcome::success();
  }

  outcome::result<TimezonePtr> TimezoneResolver::resolve(
      const std::string &name) const {
    if (isUtcAlias(name)) {
      return TimezonePtr{};
    }
    if (auto zone{database_.time_zone_from_region(name)}) {
      return zone;
    }
    auto builtin{kBuiltinZones.find(name)};
    if (builtin != kBuiltinZones.end()) {
      return fromPosixRule(builtin->second);
    }
    // region names contain '/', posix rules contain an offset
    if (name.find('/') == std::string::npos
        && name.find_first_of("0123456789") != std::string::npos) {
      return fromPosixRule(name);
    }
    return TimezoneError::kUnknownTimezone;
  }

  LocalTime TimezoneResolver::toLocal(UnixTime time, const TimezonePtr &zone) {
    auto wall{toPtime(time)};
    if (zone) {
      wall = boost::local_time::local_date_time{wall, zone}.local_time();
    }
    LocalTime local;
    local.date = wall.date();
    local.weekday = local.date.day_of_week().as_number();
    local.hour = static_cast<int>(wall.time_of_day().hours());
    local.minute_of_day =
        static_cast<int>(wall.time_of_day().total_seconds() / 60);
    return local;
  }
}  // namespace isched::clock
