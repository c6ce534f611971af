/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/date_time/gregorian/greg_date.hpp>
#include <boost/date_time/local_time/local_time_types.hpp>
#include <boost/date_time/local_time/tz_database.hpp>

#include "clock/time.hpp"

namespace isched::clock {
  enum class TimezoneError {
    kUnknownTimezone = 1,
    kDatabaseLoadFailed,
  };

  /// Null pointer stands for UTC
  using TimezonePtr = boost::local_time::time_zone_ptr;

  /**
   * Wall clock breakdown of an instant in some timezone
   */
  struct LocalTime {
    boost::gregorian::date date;
    /// 0 - Sunday, 6 - Saturday
    int weekday{};
    int hour{};
    int minute_of_day{};
  };

  /**
   * Resolves timezone names to Boost.Date_Time zones.
   *
   * Lookup order: UTC aliases, loaded tz database (boost csv format),
   * builtin table of common IANA names, raw posix rule ("EST-05EDT,M3.2.0,M11.1.0").
   */
  class TimezoneResolver {
   public:
    TimezoneResolver() = default;

    /**
     * Loads boost `date_time_zonespec.csv` database
     * @param path - csv file path
     */
    outcome::result<void> loadDatabase(const std::string &path);

    outcome::result<TimezonePtr> resolve(const std::string &name) const;

    static LocalTime toLocal(UnixTime time, const TimezonePtr &zone);

   private:
    boost::local_time::tz_database database_;
  };
}  // namespace isched::clock

OUTCOME_HPP_DECLARE_ERROR(isched::clock, TimezoneError);
