/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/scheduler_config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include "cli/validate/with.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(isched::config, ConfigError, e) {
  using isched::config::ConfigError;
  switch (e) {
    case ConfigError::kInvalidWeights:
      return "ConfigError: scoring weights must sum to 1.0";
    case ConfigError::kInvalidWorkingHours:
      return "ConfigError: invalid working hours";
    case ConfigError::kInvalidDay:
      return "ConfigError: invalid working day";
    case ConfigError::kInvalidValue:
      return "ConfigError: invalid value";
  }
  return "ConfigError: unknown error";
}

namespace isched::config {
  namespace po = boost::program_options;

  constexpr int kMinutesPerDay{24 * 60};

  /**
   * "FROM-TO=SCORE", e.g. "9-11=1.0"
   */
  CLI_VALIDATE(HourBand) {
    validateWith(out, values, [](const std::string &value) {
      HourBand band;
      char dash{}, eq{};
      std::istringstream s{value};
      s >> band.from_hour >> dash >> band.to_hour >> eq >> band.score;
      if (s.fail() || dash != '-' || eq != '=' || band.from_hour < 0
          || band.to_hour > 23 || band.from_hour > band.to_hour) {
        throw std::invalid_argument{value};
      }
      return band;
    });
  }

  /**
   * "MAX=SCORE", e.g. "2=0.8"
   */
  CLI_VALIDATE(WorkloadBucket) {
    validateWith(out, values, [](const std::string &value) {
      WorkloadBucket bucket;
      char eq{};
      std::istringstream s{value};
      s >> bucket.max_bookings >> eq >> bucket.score;
      if (s.fail() || eq != '=' || bucket.max_bookings < 0) {
        throw std::invalid_argument{value};
      }
      return bucket;
    });
  }

  /**
   * "HOURS=SCORE", e.g. "24=1.0"
   */
  CLI_VALIDATE(LeadBand) {
    validateWith(out, values, [](const std::string &value) {
      int within{-1};
      LeadBand band;
      char eq{};
      std::istringstream s{value};
      s >> within >> eq >> band.score;
      if (s.fail() || eq != '=' || within < 0) {
        throw std::invalid_argument{value};
      }
      band.within = hours{within};
      return band;
    });
  }

  namespace {
    bool isScore(double value) {
      return value >= 0 && value <= 1;
    }

    template <typename Bands>
    bool areScores(const Bands &bands) {
      return std::all_of(bands.begin(), bands.end(), [](const auto &band) {
        return isScore(band.score);
      });
    }

    /// every scoring constant is a sub-score in [0, 1]
    bool scoresInRange(const ScoringConfig &scoring) {
      const auto &urgency{scoring.urgency};
      if (!areScores(scoring.time_preference) || !areScores(scoring.workload)
          || !areScores(scoring.candidate_convenience)
          || !areScores(urgency.urgent) || !areScores(urgency.high)) {
        return false;
      }
      for (auto value : {scoring.time_preference_fallback,
                         scoring.workload_fallback,
                         scoring.candidate_convenience_fallback,
                         scoring.candidate_convenience_unresolved,
                         urgency.urgent_fallback,
                         urgency.high_fallback,
                         urgency.routine_far,
                         urgency.routine_near,
                         scoring.conflict_penalty,
                         scoring.time_preference_threshold,
                         scoring.availability_threshold,
                         scoring.workload_threshold,
                         scoring.candidate_convenience_threshold,
                         scoring.urgency_threshold}) {
        if (!isScore(value)) {
          return false;
        }
      }
      return true;
    }
  }  // namespace

  double ScoringWeights::sum() const {
    return time_preference + availability_quality + interviewer_workload
           + candidate_convenience + urgency_factor;
  }

  outcome::result<void> SchedulerConfig::validate() const {
    const auto &weights{scoring.weights};
    for (auto weight : {weights.time_preference,
                        weights.availability_quality,
                        weights.interviewer_workload,
                        weights.candidate_convenience,
                        weights.urgency_factor}) {
      if (weight < 0) {
        return ConfigError::kInvalidWeights;
      }
    }
    if (std::fabs(weights.sum() - 1.0) > 1e-6) {
      return ConfigError::kInvalidWeights;
    }
    if (working_hours.days.empty()) {
      return ConfigError::kInvalidDay;
    }
    for (auto day : working_hours.days) {
      if (day < 0 || day > 6) {
        return ConfigError::kInvalidDay;
      }
    }
    if (working_hours.start_minute < 0
        || working_hours.end_minute > kMinutesPerDay
        || working_hours.start_minute >= working_hours.end_minute) {
      return ConfigError::kInvalidWorkingHours;
    }
    if (slot_step.count() <= 0 || min_duration.count() <= 0
        || min_duration > max_duration || alternates == 0
        || max_optimal_slots == 0 || max_reschedule_attempts < 0
        || read_timeout.count() <= 0 || worker_threads == 0
        || !scoresInRange(scoring)
        || scoring.urgency.routine_min_lead.count() < 0
        || reschedule_lead >= reschedule_horizon
        || default_lead >= default_horizon) {
      return ConfigError::kInvalidValue;
    }
    return outcome::success();
  }

  outcome::result<int> minuteOfDayFromString(const std::string &str) {
    int hour{-1}, minute{-1};
    char colon{};
    std::istringstream s{str};
    s >> hour >> colon >> minute;
    if (s.fail() || colon != ':' || hour < 0 || hour > 24 || minute < 0
        || minute > 59 || hour * 60 + minute > kMinutesPerDay) {
      return ConfigError::kInvalidWorkingHours;
    }
    return hour * 60 + minute;
  }

  outcome::result<std::set<int>> weekdaysFromString(const std::string &str) {
    static const std::vector<std::string> kNames{
        "sun", "mon", "tue", "wed", "thu", "fri", "sat"};
    std::vector<std::string> parts;
    boost::algorithm::split(
        parts, str, [](char c) { return c == ',' || c == ' '; });
    std::set<int> days;
    for (auto &part : parts) {
      boost::algorithm::trim(part);
      boost::algorithm::to_lower(part);
      if (part.empty()) {
        continue;
      }
      // accept both "mon" and "monday"
      const auto prefix{part.substr(0, 3)};
      auto it{std::find(kNames.begin(), kNames.end(), prefix)};
      if (it == kNames.end()) {
        return ConfigError::kInvalidDay;
      }
      days.insert(static_cast<int>(it - kNames.begin()));
    }
    if (days.empty()) {
      return ConfigError::kInvalidDay;
    }
    return days;
  }

  options_description configScheduler(SchedulerConfig &config) {
    options_description desc("Scheduling options");
    auto option{desc.add_options()};

    option("working-days",
           po::value<std::string>()
               ->default_value("mon,tue,wed,thu,fri")
               ->notifier([&config](const std::string &value) {
                 auto days{weekdaysFromString(value)};
                 if (!days) {
                   throw po::invalid_option_value{value};
                 }
                 config.working_hours.days = std::move(days.value());
               }),
           "working days, comma separated");
    option("working-hours-start",
           po::value<std::string>()->default_value("09:00")->notifier(
               [&config](const std::string &value) {
                 auto minute{minuteOfDayFromString(value)};
                 if (!minute) {
                   throw po::invalid_option_value{value};
                 }
                 config.working_hours.start_minute = minute.value();
               }),
           "daily working hours start, HH:MM");
    option("working-hours-end",
           po::value<std::string>()->default_value("17:00")->notifier(
               [&config](const std::string &value) {
                 auto minute{minuteOfDayFromString(value)};
                 if (!minute) {
                   throw po::invalid_option_value{value};
                 }
                 config.working_hours.end_minute = minute.value();
               }),
           "daily working hours end, HH:MM");
    option("working-timezone",
           po::value(&config.working_hours.timezone)
               ->default_value(config.working_hours.timezone),
           "timezone of working hours and time preference");
    option("slot-step",
           po::value<int>()
               ->default_value(static_cast<int>(config.slot_step.count()))
               ->notifier([&config](int v) { config.slot_step = minutes{v}; }),
           "slot search granularity, minutes");

    auto &weights{config.scoring.weights};
    option("weight-time-preference",
           po::value(&weights.time_preference)
               ->default_value(weights.time_preference));
    option("weight-availability",
           po::value(&weights.availability_quality)
               ->default_value(weights.availability_quality));
    option("weight-workload",
           po::value(&weights.interviewer_workload)
               ->default_value(weights.interviewer_workload));
    option("weight-candidate-convenience",
           po::value(&weights.candidate_convenience)
               ->default_value(weights.candidate_convenience));
    option("weight-urgency",
           po::value(&weights.urgency_factor)
               ->default_value(weights.urgency_factor));
    option("time-preference-band",
           po::value(&config.scoring.time_preference)->composing(),
           "hour band score FROM-TO=SCORE, replaces builtin bands");
    option("candidate-convenience-band",
           po::value(&config.scoring.candidate_convenience)->composing(),
           "hour band score FROM-TO=SCORE, replaces builtin bands");
    option("workload-bucket",
           po::value(&config.scoring.workload)->composing(),
           "same day bookings bucket MAX=SCORE, replaces builtin buckets");
    option("conflict-penalty",
           po::value(&config.scoring.conflict_penalty)
               ->default_value(config.scoring.conflict_penalty),
           "score multiplier of slots with conflicts");
    option("time-preference-fallback",
           po::value(&config.scoring.time_preference_fallback)
               ->default_value(config.scoring.time_preference_fallback),
           "score of hours outside time preference bands");
    option("candidate-convenience-fallback",
           po::value(&config.scoring.candidate_convenience_fallback)
               ->default_value(config.scoring.candidate_convenience_fallback),
           "score of candidate hours outside convenience bands");
    option("candidate-convenience-unresolved",
           po::value(&config.scoring.candidate_convenience_unresolved)
               ->default_value(
                   config.scoring.candidate_convenience_unresolved),
           "candidate convenience when candidate timezone is unknown");
    option("workload-fallback",
           po::value(&config.scoring.workload_fallback)
               ->default_value(config.scoring.workload_fallback),
           "score of workloads above every bucket");

    auto &urgency{config.scoring.urgency};
    option("urgency-urgent-band",
           po::value(&urgency.urgent)->composing(),
           "urgent priority lead band HOURS=SCORE, replaces builtin bands");
    option("urgency-urgent-fallback",
           po::value(&urgency.urgent_fallback)
               ->default_value(urgency.urgent_fallback));
    option("urgency-high-band",
           po::value(&urgency.high)->composing(),
           "high priority lead band HOURS=SCORE, replaces builtin bands");
    option("urgency-high-fallback",
           po::value(&urgency.high_fallback)
               ->default_value(urgency.high_fallback));
    option("urgency-routine-min-lead-hours",
           po::value<int>()
               ->default_value(
                   static_cast<int>(urgency.routine_min_lead.count()))
               ->notifier([&urgency](int v) {
                 urgency.routine_min_lead = hours{v};
               }),
           "medium and low priority prefer slots at least this far out");
    option("urgency-routine-far",
           po::value(&urgency.routine_far)->default_value(urgency.routine_far));
    option("urgency-routine-near",
           po::value(&urgency.routine_near)
               ->default_value(urgency.routine_near));

    auto &scoring{config.scoring};
    option("time-preference-threshold",
           po::value(&scoring.time_preference_threshold)
               ->default_value(scoring.time_preference_threshold),
           "time preference above which a reason is reported");
    option("availability-threshold",
           po::value(&scoring.availability_threshold)
               ->default_value(scoring.availability_threshold));
    option("workload-threshold",
           po::value(&scoring.workload_threshold)
               ->default_value(scoring.workload_threshold));
    option("candidate-convenience-threshold",
           po::value(&scoring.candidate_convenience_threshold)
               ->default_value(scoring.candidate_convenience_threshold));
    option("urgency-threshold",
           po::value(&scoring.urgency_threshold)
               ->default_value(scoring.urgency_threshold));

    option("alternates",
           po::value(&config.alternates)->default_value(config.alternates),
           "number of alternate slots reported");
    option("max-reschedule-attempts",
           po::value(&config.max_reschedule_attempts)
               ->default_value(config.max_reschedule_attempts));
    option("reschedule-lead-hours",
           po::value<int>()
               ->default_value(static_cast<int>(config.reschedule_lead.count()))
               ->notifier(
                   [&config](int v) { config.reschedule_lead = hours{v}; }));
    option("reschedule-horizon-days",
           po::value<int>()
               ->default_value(
                   static_cast<int>(config.reschedule_horizon.count() / 24))
               ->notifier([&config](int v) {
                 config.reschedule_horizon = hours{v * 24};
               }));
    option("read-timeout-ms",
           po::value<int>()
               ->default_value(static_cast<int>(config.read_timeout.count()))
               ->notifier(
                   [&config](int v) { config.read_timeout = milliseconds{v}; }),
           "bound of availability and candidate/job reads");
    option("worker-threads",
           po::value(&config.worker_threads)
               ->default_value(config.worker_threads));
    option("tz-database",
           po::value<std::string>()->notifier(
               [&config](const std::string &path) {
                 config.tz_database = path;
               }),
           "boost date_time_zonespec.csv timezone database");

    return desc;
  }
}  // namespace isched::config
