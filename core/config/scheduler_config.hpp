/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>

#include "clock/time.hpp"
#include "common/outcome.hpp"

namespace isched::config {
  using boost::program_options::options_description;
  using clock::hours;
  using clock::milliseconds;
  using clock::minutes;

  enum class ConfigError {
    kInvalidWeights = 1,
    kInvalidWorkingHours,
    kInvalidDay,
    kInvalidValue,
  };

  /**
   * Hour-of-day band, both ends inclusive: {9, 11, 1.0} matches 09:00-11:59
   */
  struct HourBand {
    int from_hour{};
    int to_hour{};
    double score{};
  };

  /**
   * Same-day booking count bucket: counts up to `max_bookings` score `score`
   */
  struct WorkloadBucket {
    int max_bookings{};
    double score{};
  };

  /**
   * Lead time band: slots starting within `within` from now score `score`
   */
  struct LeadBand {
    hours within{};
    double score{};
  };

  struct WorkingHours {
    /// 0 - Sunday, 6 - Saturday
    std::set<int> days{1, 2, 3, 4, 5};
    int start_minute{9 * 60};
    int end_minute{17 * 60};
    /// reference zone of working hours and time preference
    std::string timezone{"UTC"};
  };

  struct ScoringWeights {
    double time_preference{0.30};
    double availability_quality{0.25};
    double interviewer_workload{0.20};
    double candidate_convenience{0.15};
    double urgency_factor{0.10};

    double sum() const;
  };

  struct UrgencyBands {
    std::vector<LeadBand> urgent{{hours{24}, 1.0}, {hours{48}, 0.8}};
    double urgent_fallback{0.5};
    std::vector<LeadBand> high{{hours{72}, 1.0}};
    double high_fallback{0.7};
    /// medium and low priority prefer slots at least this far out
    hours routine_min_lead{24};
    double routine_far{1.0};
    double routine_near{0.6};
  };

  /**
   * Heuristic scoring constants. Bands are checked in order, first match wins.
   */
  struct ScoringConfig {
    ScoringWeights weights;

    std::vector<HourBand> time_preference{
        {9, 11, 1.0}, {13, 15, 0.9}, {8, 17, 0.7}};
    double time_preference_fallback{0.3};

    std::vector<WorkloadBucket> workload{{0, 1.0}, {2, 0.8}, {4, 0.6}};
    double workload_fallback{0.3};

    std::vector<HourBand> candidate_convenience{{9, 17, 1.0}, {8, 18, 0.8}};
    double candidate_convenience_fallback{0.4};
    /// used when candidate timezone cannot be resolved
    double candidate_convenience_unresolved{0.8};

    UrgencyBands urgency;

    double conflict_penalty{0.7};

    /// sub-scores above threshold add a reason tag
    double time_preference_threshold{0.7};
    double availability_threshold{0.8};
    double workload_threshold{0.7};
    double candidate_convenience_threshold{0.8};
    double urgency_threshold{0.5};
  };

  struct SchedulerConfig {
    WorkingHours working_hours;
    minutes slot_step{30};
    ScoringConfig scoring;

    minutes min_duration{15};
    minutes max_duration{480};
    minutes default_duration{60};

    /// search window of requests without explicit window
    hours default_lead{24};
    hours default_horizon{24 * 30};

    size_t alternates{3};
    size_t max_optimal_slots{20};
    int max_reschedule_attempts{3};
    hours reschedule_lead{24};
    hours reschedule_horizon{24 * 30};

    /// bound of every external read (availability, candidate/job lookup)
    milliseconds read_timeout{5000};
    size_t worker_threads{4};

    boost::optional<std::string> tz_database;

    outcome::result<void> validate() const;
  };

  /// "HH:MM" to minute of day
  outcome::result<int> minuteOfDayFromString(const std::string &str);

  /// "mon,tue,wed" to weekday numbers, 0 - Sunday
  outcome::result<std::set<int>> weekdaysFromString(const std::string &str);

  /**
   * Creates program option description for scheduling parameters bound to
   * `config` fields. Values are written to `config` on
   * boost::program_options::notify.
   */
  options_description configScheduler(SchedulerConfig &config);
}  // namespace isched::config

OUTCOME_HPP_DECLARE_ERROR(isched::config, ConfigError);
