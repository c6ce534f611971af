/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "common/outcome.hpp"

namespace isched::clock {
  enum class TimeFromStringError { kInvalidFormat = 1 };

  using UnixTime = std::chrono::seconds;
  using std::chrono::hours;
  using std::chrono::microseconds;
  using std::chrono::milliseconds;
  using std::chrono::minutes;
  using Time = UnixTime;

  /// "YYYY-MM-DDTHH:MM:SSZ"
  std::string unixTimeToString(UnixTime);
  outcome::result<UnixTime> unixTimeFromString(const std::string &str);

  boost::posix_time::ptime toPtime(UnixTime time);
  UnixTime fromPtime(const boost::posix_time::ptime &ptime);

  /// "HH:MM" of UTC wall clock
  std::string hourMinuteString(UnixTime time);
}  // namespace isched::clock

OUTCOME_HPP_DECLARE_ERROR(isched::clock, TimeFromStringError);
