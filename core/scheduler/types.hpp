/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_TYPES_HPP
#define ISCHED_CORE_SCHEDULER_TYPES_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "clock/time.hpp"
#include "common/enum.hpp"

namespace isched::scheduler {
  using clock::UnixTime;
  using common::ConversionTable;

  /// Interviewer email
  using ParticipantId = std::string;
  using InterviewId = std::string;
  using CandidateId = std::string;
  using JobId = std::string;

  enum class Priority { kUrgent, kHigh, kMedium, kLow };

  enum class Strategy {
    kOptimizeTime,
    kOptimizeQuality,
    kOptimizeCandidate,
    kBalanced,
  };

  enum class InterviewType {
    kPhoneScreen,
    kVideoCall,
    kInPerson,
    kTechnical,
    kPanel,
    kFinal,
  };

  enum class InterviewStatus {
    kScheduled,
    kConfirmed,
    kRescheduled,
    kCancelled,
    kCompleted,
    kNoShow,
  };

  /// Events changing interview status
  enum class InterviewEvent {
    kConfirm,
    kCancel,
    kComplete,
    kNoShow,
    kReschedule,
  };

  enum class AvailabilityType { kBusy, kAvailable };

  inline const auto &class_conversion_table(Priority) {
    static const ConversionTable<Priority, 4> table{{
        {Priority::kUrgent, "urgent"},
        {Priority::kHigh, "high"},
        {Priority::kMedium, "medium"},
        {Priority::kLow, "low"},
    }};
    return table;
  }

  inline const auto &class_conversion_table(Strategy) {
    static const ConversionTable<Strategy, 4> table{{
        {Strategy::kOptimizeTime, "optimize_time"},
        {Strategy::kOptimizeQuality, "optimize_quality"},
        {Strategy::kOptimizeCandidate, "optimize_candidate"},
        {Strategy::kBalanced, "balanced"},
    }};
    return table;
  }

  inline const auto &class_conversion_table(InterviewType) {
    static const ConversionTable<InterviewType, 6> table{{
        {InterviewType::kPhoneScreen, "phone_screen"},
        {InterviewType::kVideoCall, "video_call"},
        {InterviewType::kInPerson, "in_person"},
        {InterviewType::kTechnical, "technical"},
        {InterviewType::kPanel, "panel"},
        {InterviewType::kFinal, "final"},
    }};
    return table;
  }

  inline const auto &class_conversion_table(InterviewStatus) {
    static const ConversionTable<InterviewStatus, 6> table{{
        {InterviewStatus::kScheduled, "scheduled"},
        {InterviewStatus::kConfirmed, "confirmed"},
        {InterviewStatus::kRescheduled, "rescheduled"},
        {InterviewStatus::kCancelled, "cancelled"},
        {InterviewStatus::kCompleted, "completed"},
        {InterviewStatus::kNoShow, "no_show"},
    }};
    return table;
  }

  inline const auto &class_conversion_table(InterviewEvent) {
    static const ConversionTable<InterviewEvent, 5> table{{
        {InterviewEvent::kConfirm, "confirm"},
        {InterviewEvent::kCancel, "cancel"},
        {InterviewEvent::kComplete, "complete"},
        {InterviewEvent::kNoShow, "no_show"},
        {InterviewEvent::kReschedule, "reschedule"},
    }};
    return table;
  }

  inline const auto &class_conversion_table(AvailabilityType) {
    static const ConversionTable<AvailabilityType, 2> table{{
        {AvailabilityType::kBusy, "busy"},
        {AvailabilityType::kAvailable, "available"},
    }};
    return table;
  }

  /// Name from conversion table, empty for values missing in table
  template <typename Enumeration>
  std::string enumName(Enumeration value) {
    if (auto name{common::to_string(value)}) {
      return std::string{*name};
    }
    return {};
  }

  /// "phone_screen" -> "Phone Screen"
  std::string interviewTypeTitle(InterviewType type);

  /// Half-open interval [start, end)
  struct Interval {
    UnixTime start{};
    UnixTime end{};

    UnixTime duration() const {
      return end - start;
    }

    bool overlaps(const Interval &other) const {
      return start < other.end && other.start < end;
    }

    bool contains(const Interval &other) const {
      return start <= other.start && other.end <= end;
    }
  };

  inline bool operator==(const Interval &l, const Interval &r) {
    return l.start == r.start && l.end == r.end;
  }

  inline bool operator!=(const Interval &l, const Interval &r) {
    return !(l == r);
  }

  /// One reason why participant cannot attend a slot
  struct Conflict {
    ParticipantId participant;
    std::string reason;
    Interval window;
  };

  struct ScoreBreakdown {
    double time_preference{};
    double availability_quality{};
    double interviewer_workload{};
    double candidate_convenience{};
    double urgency_factor{};
    /// weighted sum before conflict penalty
    double combined{};
  };

  struct TimeSlot {
    Interval interval;
    double score{};
    std::vector<Conflict> conflicts;
    std::set<ParticipantId> participants_available;
    std::set<ParticipantId> participants_unavailable;
    std::vector<std::string> reasons;
    ScoreBreakdown breakdown;
  };

  struct SchedulingRequest {
    CandidateId candidate_id;
    JobId job_id;
    InterviewType interview_type{InterviewType::kVideoCall};
    std::vector<ParticipantId> interviewers;
    int duration_minutes{60};
    UnixTime earliest_start{};
    UnixTime latest_end{};
    /// candidate timezone
    std::string timezone{"UTC"};
    Priority priority{Priority::kMedium};
    Strategy strategy{Strategy::kBalanced};
    std::vector<Interval> preferred_times;
    std::map<std::string, std::string> requirements;
  };

  struct Interview {
    InterviewId id;
    /// incremented on every stored change
    uint64_t version{};
    CandidateId candidate_id;
    JobId job_id;
    InterviewType interview_type{};
    InterviewStatus status{InterviewStatus::kScheduled};
    std::string title;
    std::string description;
    Interval scheduled;
    int duration_minutes{};
    std::string timezone;
    std::vector<ParticipantId> interviewers;
    ParticipantId primary_interviewer;
    std::vector<Conflict> conflicts_detected;
    std::map<std::string, std::string> scheduling_preferences;
    Priority priority{Priority::kMedium};
    bool auto_scheduled{true};
    int reschedule_count{};
    std::string reschedule_reason;
    boost::optional<InterviewId> original_interview_id;
    UnixTime created_at{};
    UnixTime updated_at{};
  };

  /// Existing commitment of participants, e.g. another interview
  struct Booking {
    std::string id;
    std::string title;
    Interval interval;
    std::vector<ParticipantId> participants;
  };

  /// Explicit busy or available marker
  struct AvailabilitySlot {
    ParticipantId participant;
    Interval interval;
    AvailabilityType type{AvailabilityType::kBusy};
    /// repeats weekly from `interval`
    bool recurring{false};
    std::string notes;
  };

  struct AlternateSlot {
    Interval interval;
    double score{};
    std::vector<std::string> reasons;
  };

  enum class LogAction { kSchedule, kReschedule, kStatus };

  inline const auto &class_conversion_table(LogAction) {
    static const ConversionTable<LogAction, 3> table{{
        {LogAction::kSchedule, "schedule"},
        {LogAction::kReschedule, "reschedule"},
        {LogAction::kStatus, "status"},
    }};
    return table;
  }

  /// Audit record, one per attempt
  struct SchedulingLogEntry {
    std::string id;
    boost::optional<InterviewId> interview_id;
    LogAction action{LogAction::kSchedule};
    bool success{};
    Strategy strategy{Strategy::kBalanced};
    size_t slots_evaluated{};
    clock::milliseconds processing_time{};
    boost::optional<double> best_score;
    std::vector<AlternateSlot> alternates;
    std::vector<Conflict> conflicts;
    std::vector<std::string> errors;
    UnixTime timestamp{};
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_TYPES_HPP
