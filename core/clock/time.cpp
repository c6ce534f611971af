/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <spdlog/fmt/fmt.h>

OUTCOME_CPP_DEFINE_CATEGORY(isched::clock, TimeFromStringError, e) {
  using isched::clock::TimeFromStringError;
  if (e == TimeFromStringError::kInvalidFormat) {
    return "Input has invalid format";
  }
  return "Unknown error";
}

namespace isched::clock {
  const static boost::posix_time::ptime kPtimeUnixZero(
      boost::gregorian::date(1970, 1, 1));

  std::string unixTimeToString(UnixTime time) {
    return boost::posix_time::to_iso_extended_string(toPtime(time)) + "Z";
  }

  outcome::result<UnixTime> unixTimeFromString(const std::string &str) {
    if (str.size() != 20 || str[str.size() - 1] != 'Z') {
      return TimeFromStringError::kInvalidFormat;
    }
    boost::posix_time::ptime ptime;
    try {
      ptime = boost::posix_time::from_iso_extended_string(
          str.substr(0, str.size() - 1));
    } catch (const std::exception &) {
      return TimeFromStringError::kInvalidFormat;
    }
    if (ptime.is_special()) {
      return TimeFromStringError::kInvalidFormat;
    }
    return fromPtime(ptime);
  }

  boost::posix_time::ptime toPtime(UnixTime time) {
    return kPtimeUnixZero + boost::posix_time::seconds{time.count()};
  }

  UnixTime fromPtime(const boost::posix_time::ptime &ptime) {
    return UnixTime{(ptime - kPtimeUnixZero).total_seconds()};
  }

  std::string hourMinuteString(UnixTime time) {
    const auto tod{toPtime(time).time_of_day()};
    return fmt::format("{:02}:{:02}", tod.hours(), tod.minutes());
  }
}  // namespace isched::clock
