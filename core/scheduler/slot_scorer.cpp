/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/slot_scorer.hpp"

#include <spdlog/fmt/fmt.h>

namespace isched::scheduler {
  using clock::TimezoneResolver;
  using config::HourBand;
  using config::LeadBand;

  namespace {
    double bandScore(const std::vector<HourBand> &bands,
                     int hour,
                     double fallback) {
      for (const auto &band : bands) {
        if (band.from_hour <= hour && hour <= band.to_hour) {
          return band.score;
        }
      }
      return fallback;
    }

    double leadScore(const std::vector<LeadBand> &bands,
                     UnixTime until,
                     double fallback) {
      for (const auto &band : bands) {
        if (until <= band.within) {
          return band.score;
        }
      }
      return fallback;
    }
  }  // namespace

  SlotScorer::SlotScorer(config::ScoringConfig config,
                         WorkingCalendar calendar,
                         std::shared_ptr<clock::TimezoneResolver> resolver)
      : config_{std::move(config)},
        calendar_{std::move(calendar)},
        resolver_{std::move(resolver)} {}

  ScoringContext SlotScorer::context(const SchedulingRequest &request,
                                     const AvailabilitySnapshot &snapshot,
                                     UnixTime now) const {
    ScoringContext context{request, snapshot, boost::none, now};
    if (auto zone{resolver_->resolve(request.timezone)}) {
      context.candidate_zone = zone.value();
    }
    return context;
  }

  void SlotScorer::score(TimeSlot &slot, const ScoringContext &context) const {
    const auto &weights{config_.weights};
    auto &breakdown{slot.breakdown};
    slot.reasons.clear();

    breakdown.time_preference = timePreference(slot.interval);
    if (breakdown.time_preference > config_.time_preference_threshold) {
      slot.reasons.push_back(fmt::format("Good time match (score: {:.1f})",
                                         breakdown.time_preference));
    }
    breakdown.availability_quality =
        availabilityQuality(slot, context.request);
    if (breakdown.availability_quality > config_.availability_threshold) {
      slot.reasons.emplace_back("High availability quality");
    }
    breakdown.interviewer_workload =
        interviewerWorkload(slot, context.snapshot);
    if (breakdown.interviewer_workload > config_.workload_threshold) {
      slot.reasons.emplace_back("Good interviewer availability");
    }
    breakdown.candidate_convenience =
        candidateConvenience(slot.interval, context.candidate_zone);
    if (breakdown.candidate_convenience
        > config_.candidate_convenience_threshold) {
      slot.reasons.emplace_back("Convenient for candidate");
    }
    breakdown.urgency_factor =
        urgency(slot.interval, context.request.priority, context.now);
    if (breakdown.urgency_factor > config_.urgency_threshold) {
      slot.reasons.emplace_back("Meets urgency requirements");
    }
    for (const auto &preferred : context.request.preferred_times) {
      if (preferred.contains(slot.interval)) {
        slot.reasons.emplace_back("Within preferred time window");
        break;
      }
    }

    breakdown.combined =
        weights.time_preference * breakdown.time_preference
        + weights.availability_quality * breakdown.availability_quality
        + weights.interviewer_workload * breakdown.interviewer_workload
        + weights.candidate_convenience * breakdown.candidate_convenience
        + weights.urgency_factor * breakdown.urgency_factor;
    slot.score = breakdown.combined;
    if (!slot.conflicts.empty()) {
      slot.score *= config_.conflict_penalty;
      slot.reasons.push_back(
          fmt::format("Has {} conflicts", slot.conflicts.size()));
    }
  }

  double SlotScorer::timePreference(const Interval &slot) const {
    return bandScore(config_.time_preference,
                     calendar_.local(slot.start).hour,
                     config_.time_preference_fallback);
  }

  double SlotScorer::availabilityQuality(
      const TimeSlot &slot, const SchedulingRequest &request) const {
    if (slot.participants_available.empty() || request.interviewers.empty()) {
      return 0;
    }
    return static_cast<double>(slot.participants_available.size())
           / static_cast<double>(request.interviewers.size());
  }

  double SlotScorer::interviewerWorkload(
      const TimeSlot &slot, const AvailabilitySnapshot &snapshot) const {
    if (slot.participants_available.empty()) {
      return 0;
    }
    const auto day{calendar_.local(slot.interval.start).date};
    double total{0};
    for (const auto &participant : slot.participants_available) {
      int bookings{0};
      for (const auto &booking : snapshot.calendar(participant).bookings) {
        if (calendar_.local(booking.interval.start).date == day) {
          ++bookings;
        }
      }
      auto score{config_.workload_fallback};
      for (const auto &bucket : config_.workload) {
        if (bookings <= bucket.max_bookings) {
          score = bucket.score;
          break;
        }
      }
      total += score;
    }
    return total / static_cast<double>(slot.participants_available.size());
  }

  double SlotScorer::candidateConvenience(
      const Interval &slot,
      const boost::optional<clock::TimezonePtr> &candidate_zone) const {
    if (!candidate_zone) {
      return config_.candidate_convenience_unresolved;
    }
    return bandScore(config_.candidate_convenience,
                     TimezoneResolver::toLocal(slot.start, *candidate_zone).hour,
                     config_.candidate_convenience_fallback);
  }

  double SlotScorer::urgency(const Interval &slot,
                             Priority priority,
                             UnixTime now) const {
    const auto &bands{config_.urgency};
    const auto until{slot.start - now};
    switch (priority) {
      case Priority::kUrgent:
        return leadScore(bands.urgent, until, bands.urgent_fallback);
      case Priority::kHigh:
        return leadScore(bands.high, until, bands.high_fallback);
      case Priority::kMedium:
      case Priority::kLow:
        return until >= bands.routine_min_lead ? bands.routine_far
                                               : bands.routine_near;
    }
    return bands.routine_near;
  }

  const config::ScoringConfig &SlotScorer::config() const {
    return config_;
  }
}  // namespace isched::scheduler
