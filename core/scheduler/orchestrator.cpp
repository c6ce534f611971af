/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/orchestrator.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/fmt/fmt.h>

#include "common/async.hpp"
#include "common/logger.hpp"

namespace isched::scheduler {
  using std::chrono::steady_clock;

  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("orchestrator");
      return logger;
    }

    milliseconds elapsedSince(steady_clock::time_point started) {
      return std::chrono::duration_cast<milliseconds>(steady_clock::now()
                                                      - started);
    }

    SchedulingFailure failureOf(SchedulerError error, std::string message) {
      return SchedulingFailure{error, {std::move(message)}};
    }

    /// "480" -> "8 hours", "90" -> "90 minutes"
    std::string durationText(minutes duration) {
      if (duration.count() % 60 == 0) {
        const auto count{duration.count() / 60};
        return fmt::format("{} hour{}", count, count == 1 ? "" : "s");
      }
      return fmt::format("{} minutes", duration.count());
    }

    template <typename T>
    auto fail(SchedulingFailure failure) {
      return SchedulingResult<T>{
          BOOST_OUTCOME_V2_NAMESPACE::failure(std::move(failure))};
    }
  }  // namespace

  outcome::result<std::shared_ptr<Orchestrator>> Orchestrator::create(
      config::SchedulerConfig config, OrchestratorDeps deps) {
    OUTCOME_TRY(config.validate());
    if (config.tz_database) {
      OUTCOME_TRY(deps.timezones->loadDatabase(*config.tz_database));
    }
    OUTCOME_TRY(zone, deps.timezones->resolve(config.working_hours.timezone));
    return std::shared_ptr<Orchestrator>{
        new Orchestrator{std::move(config), std::move(deps), zone}};
  }

  Orchestrator::Orchestrator(config::SchedulerConfig config,
                             OrchestratorDeps deps,
                             clock::TimezonePtr reference_zone)
      : config_{std::move(config)},
        deps_{std::move(deps)},
        gatherer_{deps_.io, deps_.availability, config_.read_timeout},
        generator_{WorkingCalendar{config_.working_hours, reference_zone},
                   config_.slot_step},
        scorer_{config_.scoring,
                WorkingCalendar{config_.working_hours, reference_zone},
                deps_.timezones},
        selector_{config_.alternates},
        policy_{config_.max_reschedule_attempts,
                config_.reschedule_lead,
                config_.reschedule_horizon} {}

  SchedulingRequest Orchestrator::normalize(
      const SchedulingRequest &input) const {
    auto request{input};
    request.interviewers.clear();
    for (const auto &interviewer : input.interviewers) {
      if (std::find(request.interviewers.begin(),
                    request.interviewers.end(),
                    interviewer)
          == request.interviewers.end()) {
        request.interviewers.push_back(interviewer);
      }
    }
    if (request.earliest_start == UnixTime{}
        && request.latest_end == UnixTime{}) {
      const auto now{deps_.clock->nowUTC()};
      request.earliest_start = now + config_.default_lead;
      request.latest_end = now + config_.default_horizon;
    }
    return request;
  }

  SchedulingResult<ScheduleResult> Orchestrator::scheduleInterview(
      const SchedulingRequest &input) {
    const auto started{steady_clock::now()};
    const auto request{normalize(input)};
    log()->info("scheduling interview of candidate {} for job {}",
                request.candidate_id,
                request.job_id);
    const auto failed{[&](SchedulingFailure failure) {
      log()->warn("scheduling of candidate {} failed: {}",
                  request.candidate_id,
                  errorKind(static_cast<SchedulerError>(failure.error.value())));
      auditFailure(LogAction::kSchedule,
                   request.strategy,
                   boost::none,
                   failure,
                   elapsedSince(started));
      return fail<ScheduleResult>(std::move(failure));
    }};

    auto lookup{validate(request)};
    if (!lookup) {
      return failed(lookup.error());
    }
    auto ranking{rank(request, boost::none)};
    if (!ranking) {
      return failed(ranking.error());
    }
    auto selection{selector_.select(ranking.value().slots)};

    auto stored{deps_.interviews->create(
        makeInterview(request, lookup.value(), selection.best))};
    if (!stored && stored.error() == RepositoryError::kSlotTaken) {
      // booked by concurrent request after our read, rank once more
      log()->info("slot {} taken concurrently, ranking again",
                  clock::unixTimeToString(selection.best.interval.start));
      ranking = rank(request, boost::none);
      if (!ranking) {
        return failed(ranking.error());
      }
      selection = selector_.select(ranking.value().slots);
      stored = deps_.interviews->create(
          makeInterview(request, lookup.value(), selection.best));
    }
    if (!stored) {
      if (stored.error() == RepositoryError::kSlotTaken) {
        return failed(failureOf(SchedulerError::kSchedulingError,
                                "Slot was taken concurrently"));
      }
      return failed(failureOf(
          SchedulerError::kSchedulingError,
          fmt::format("Interview not stored: {}", stored.error().message())));
    }

    auto result{makeResult(std::move(stored.value()),
                           selection,
                           ranking.value(),
                           request,
                           elapsedSince(started))};
    audit(successEntry(LogAction::kSchedule, result));
    notify(result.interview);
    log()->info("scheduled interview {} at {} (score {:.3f})",
                result.interview.id,
                clock::unixTimeToString(result.interview.scheduled.start),
                result.slot.score);
    return result;
  }

  SchedulingResult<std::vector<TimeSlot>> Orchestrator::findOptimalSlots(
      const SchedulingRequest &input, size_t max_slots) const {
    const auto request{normalize(input)};
    auto lookup{validate(request)};
    if (!lookup) {
      return fail<std::vector<TimeSlot>>(lookup.error());
    }
    auto ranking{rank(request, boost::none)};
    if (!ranking) {
      return fail<std::vector<TimeSlot>>(ranking.error());
    }
    auto &slots{ranking.value().slots};
    const auto limit{
        std::clamp<size_t>(max_slots, 1, config_.max_optimal_slots)};
    if (slots.size() > limit) {
      slots.resize(limit);
    }
    return std::move(slots);
  }

  SchedulingResult<ConflictReport> Orchestrator::checkConflicts(
      const Interval &interval,
      const std::vector<ParticipantId> &participants) const {
    std::vector<std::string> errors;
    if (interval.start >= interval.end) {
      errors.emplace_back("Start time must be before end time");
    }
    if (participants.empty()) {
      errors.emplace_back("At least one participant is required");
    }
    if (!errors.empty()) {
      return fail<ConflictReport>(
          {SchedulerError::kValidationFailed, std::move(errors)});
    }

    auto snapshot{gatherer_.gather(participants, interval)};
    if (!snapshot) {
      return fail<ConflictReport>(gatherFailure(snapshot.error()));
    }
    auto conflicts{detector_.detect(interval, participants, snapshot.value())};
    ConflictReport report;
    report.interval = interval;
    report.total_conflicts = conflicts.total();
    report.affected_participants = conflicts.unavailable.size();
    report.conflicts = std::move(conflicts.by_participant);
    report.available = std::move(conflicts.available);
    return report;
  }

  SchedulingResult<std::vector<ParticipantSummary>>
  Orchestrator::availabilitySummary(
      const std::vector<ParticipantId> &participants,
      const Interval &window) const {
    if (window.start >= window.end) {
      return fail<std::vector<ParticipantSummary>>(
          failureOf(SchedulerError::kValidationFailed,
                    "Start date must be before end date"));
    }
    auto snapshot{gatherer_.gather(participants, window)};
    if (!snapshot) {
      return fail<std::vector<ParticipantSummary>>(
          gatherFailure(snapshot.error()));
    }
    // items are counted by start, both window ends included
    const auto starts_inside{[&](const Interval &interval) {
      return window.start <= interval.start && interval.start <= window.end;
    }};
    std::vector<ParticipantSummary> summaries;
    for (const auto &participant : participants) {
      const auto &calendar{snapshot.value().calendar(participant)};
      ParticipantSummary summary;
      summary.participant = participant;
      summary.working_hours = config_.working_hours;
      for (const auto &booking : calendar.bookings) {
        summary.total_interviews += starts_inside(booking.interval) ? 1 : 0;
      }
      for (const auto &slot : calendar.busy) {
        summary.busy_slots += starts_inside(slot.interval) ? 1 : 0;
      }
      for (const auto &slot : calendar.available) {
        summary.available_slots += starts_inside(slot.interval) ? 1 : 0;
      }
      summaries.push_back(std::move(summary));
    }
    return summaries;
  }

  SchedulingResult<Interview> Orchestrator::updateStatus(
      const InterviewId &id, InterviewEvent event) {
    const auto started{steady_clock::now()};
    const auto now{deps_.clock->nowUTC()};
    const auto failed{[&](SchedulingFailure failure) {
      auditFailure(LogAction::kStatus,
                   Strategy::kBalanced,
                   id,
                   failure,
                   elapsedSince(started));
      return fail<Interview>(std::move(failure));
    }};

    auto interview{deps_.interviews->get(id)};
    if (!interview) {
      return failed(interviewLookupFailure(interview.error()));
    }
    auto changed{policy_.transition(interview.value(), event, now)};
    if (!changed) {
      return failed(failureOf(
          SchedulerError::kUnknownTransition,
          fmt::format("Cannot {} interview in status {}",
                      enumName(event),
                      enumName(interview.value().status))));
    }
    auto stored{deps_.interviews->update(changed.value())};
    if (!stored) {
      return failed(failureOf(
          SchedulerError::kSchedulingError,
          fmt::format("Interview not updated: {}", stored.error().message())));
    }

    SchedulingLogEntry entry;
    entry.interview_id = id;
    entry.action = LogAction::kStatus;
    entry.success = true;
    entry.processing_time = elapsedSince(started);
    audit(std::move(entry));
    log()->info("interview {} is {}", id, enumName(stored.value().status));
    return std::move(stored.value());
  }

  SchedulingResult<RescheduleResult> Orchestrator::rescheduleInterview(
      const InterviewId &id,
      const std::string &reason,
      const boost::optional<SchedulingRequest> &new_request) {
    const auto started{steady_clock::now()};
    const auto now{deps_.clock->nowUTC()};
    log()->info("rescheduling interview {}: {}", id, reason);
    auto strategy{new_request ? new_request->strategy : Strategy::kBalanced};
    const auto failed{[&](SchedulingFailure failure) {
      log()->warn("rescheduling of interview {} failed: {}",
                  id,
                  errorKind(static_cast<SchedulerError>(failure.error.value())));
      auditFailure(LogAction::kReschedule,
                   strategy,
                   id,
                   failure,
                   elapsedSince(started));
      return fail<RescheduleResult>(std::move(failure));
    }};

    auto original{deps_.interviews->get(id)};
    if (!original) {
      return failed(interviewLookupFailure(original.error()));
    }
    if (!policy_.check(original.value(), now)) {
      return failed(failureOf(SchedulerError::kCannotReschedule,
                              "Interview cannot be rescheduled (too many "
                              "attempts or not upcoming)"));
    }

    const auto request{normalize(
        new_request ? *new_request : policy_.seedRequest(original.value(), now))};
    strategy = request.strategy;
    auto lookup{validate(request)};
    if (!lookup) {
      return failed(lookup.error());
    }
    // the original booking is about to be released
    auto ranking{rank(request, original.value().id)};
    if (!ranking) {
      return failed(ranking.error());
    }
    const auto selection{selector_.select(ranking.value().slots)};

    auto replacement{makeInterview(request, lookup.value(), selection.best)};
    policy_.linkReplacement(original.value(), replacement);
    auto marked{policy_.markRescheduled(original.value(), reason, now)};
    if (!marked) {
      return failed(failureOf(SchedulerError::kCannotReschedule,
                              "Interview cannot be rescheduled"));
    }
    auto stored{deps_.interviews->reschedule(marked.value(), replacement)};
    if (!stored) {
      if (stored.error() == RepositoryError::kVersionConflict) {
        return failed(failureOf(SchedulerError::kCannotReschedule,
                                "Interview was changed concurrently"));
      }
      if (stored.error() == RepositoryError::kSlotTaken) {
        return failed(failureOf(SchedulerError::kSchedulingError,
                                "Slot was taken concurrently"));
      }
      return failed(failureOf(
          SchedulerError::kSchedulingError,
          fmt::format("Reschedule not stored: {}", stored.error().message())));
    }

    RescheduleResult result;
    result.reason = reason;
    result.replacement = makeResult(std::move(stored.value()),
                                    selection,
                                    ranking.value(),
                                    request,
                                    elapsedSince(started));
    if (auto committed{deps_.interviews->get(id)}) {
      result.original = std::move(committed.value());
    } else {
      result.original = std::move(marked.value());
    }

    audit(successEntry(LogAction::kReschedule, result.replacement));
    notify(result.replacement.interview);
    log()->info("interview {} rescheduled as {} ({} of {} attempts)",
                id,
                result.replacement.interview.id,
                result.original.reschedule_count,
                policy_.maxAttempts());
    return result;
  }

  const config::SchedulerConfig &Orchestrator::config() const {
    return config_;
  }

  SchedulingResult<Orchestrator::Lookup> Orchestrator::validate(
      const SchedulingRequest &request) const {
    std::vector<std::string> errors;

    // lookups run in parallel and share one deadline
    AsyncWait<Candidate> candidate_wait;
    AsyncWait<Job> job_wait;
    boost::asio::post(*deps_.io,
                      [directory{deps_.directory},
                       id{request.candidate_id},
                       cb{candidate_wait.callback()}] {
                        cb(directory->getCandidate(id));
                      });
    boost::asio::post(
        *deps_.io,
        [directory{deps_.directory}, id{request.job_id}, cb{job_wait.callback()}] {
          cb(directory->getJob(id));
        });
    const auto deadline{steady_clock::now() + config_.read_timeout};
    const auto remaining{[&] {
      return std::max(steady_clock::duration::zero(),
                      deadline - steady_clock::now());
    }};
    auto candidate{candidate_wait.waitFor(remaining())};
    auto job{job_wait.waitFor(remaining())};
    if (!candidate || !job) {
      return fail<Lookup>(failureOf(SchedulerError::kAvailabilityGatherTimeout,
                                    "Candidate or job lookup timed out"));
    }

    const auto check_lookup{[&](const std::error_code &error,
                                const std::string &not_found)
                                -> boost::optional<SchedulingFailure> {
      if (error == DirectoryError::kNotFound) {
        errors.push_back(not_found);
        return boost::none;
      }
      return failureOf(SchedulerError::kSchedulingError,
                       fmt::format("{}: {}", not_found, error.message()));
    }};
    if (!*candidate) {
      if (auto broken{check_lookup(candidate->error(), "Candidate not found")}) {
        return fail<Lookup>(std::move(*broken));
      }
    }
    if (!*job) {
      if (auto broken{check_lookup(job->error(), "Job position not found")}) {
        return fail<Lookup>(std::move(*broken));
      }
    }
    if (request.earliest_start >= request.latest_end) {
      errors.emplace_back("Earliest start time must be before latest end time");
    }
    const minutes duration{request.duration_minutes};
    if (duration < config_.min_duration || duration > config_.max_duration) {
      errors.push_back(
          fmt::format("Duration must be between {} and {}",
                      durationText(config_.min_duration),
                      durationText(config_.max_duration)));
    }
    if (request.interviewers.empty()) {
      errors.emplace_back("At least one interviewer email is required");
    }
    if (!errors.empty()) {
      return fail<Lookup>({SchedulerError::kValidationFailed, std::move(errors)});
    }
    return Lookup{std::move(candidate->value()), std::move(job->value())};
  }

  SchedulingResult<Orchestrator::Ranking> Orchestrator::rank(
      const SchedulingRequest &request,
      const boost::optional<InterviewId> &exclude) const {
    const Interval window{request.earliest_start, request.latest_end};
    // whole days around the window, for same-day workload
    const Interval gather_window{window.start - clock::hours{24},
                                 window.end + clock::hours{24}};
    auto snapshot{gatherer_.gather(request.interviewers, gather_window, exclude)};
    if (!snapshot) {
      return fail<Ranking>(gatherFailure(snapshot.error()));
    }

    Ranking ranking;
    for (const auto &interval :
         generator_.generate(window, minutes{request.duration_minutes})) {
      if (auto slot{detector_.evaluate(
              interval, request.interviewers, snapshot.value())}) {
        ranking.slots.push_back(std::move(*slot));
      }
    }
    ranking.slots_evaluated = ranking.slots.size();
    if (ranking.slots.empty()) {
      return fail<Ranking>(
          failureOf(SchedulerError::kNoSlotsAvailable,
                    "No suitable time slots found for the given constraints"));
    }

    const auto context{
        scorer_.context(request, snapshot.value(), deps_.clock->nowUTC())};
    for (auto &slot : ranking.slots) {
      scorer_.score(slot, context);
    }
    selector_.rank(ranking.slots);
    log()->debug("ranked {} slots", ranking.slots_evaluated);
    return ranking;
  }

  Interview Orchestrator::makeInterview(const SchedulingRequest &request,
                                        const Lookup &lookup,
                                        const TimeSlot &slot) const {
    const auto now{deps_.clock->nowUTC()};
    Interview interview;
    interview.candidate_id = request.candidate_id;
    interview.job_id = request.job_id;
    interview.interview_type = request.interview_type;
    interview.status = InterviewStatus::kScheduled;
    interview.title = fmt::format("{} Interview - {}",
                                  interviewTypeTitle(request.interview_type),
                                  lookup.candidate.name);
    interview.description =
        fmt::format("Interview for {} position", lookup.job.title);
    interview.scheduled = slot.interval;
    interview.duration_minutes = request.duration_minutes;
    interview.timezone = request.timezone;
    // request order, unavailable interviewers left out
    for (const auto &interviewer : request.interviewers) {
      if (slot.participants_available.count(interviewer) != 0) {
        interview.interviewers.push_back(interviewer);
      }
    }
    interview.primary_interviewer = interview.interviewers.front();
    interview.conflicts_detected = slot.conflicts;
    interview.scheduling_preferences = request.requirements;
    interview.priority = request.priority;
    interview.auto_scheduled = true;
    interview.created_at = now;
    interview.updated_at = now;
    return interview;
  }

  ScheduleResult Orchestrator::makeResult(Interview interview,
                                          const Selection &selection,
                                          const Ranking &ranking,
                                          const SchedulingRequest &request,
                                          milliseconds elapsed) const {
    constexpr size_t kTopReasons{3};
    ScheduleResult result;
    result.interview = std::move(interview);
    result.slot = selection.best;
    for (const auto &slot : selection.alternates) {
      AlternateSlot alternate;
      alternate.interval = slot.interval;
      alternate.score = slot.score;
      alternate.reasons.assign(
          slot.reasons.begin(),
          slot.reasons.begin() + std::min(kTopReasons, slot.reasons.size()));
      result.alternates.push_back(std::move(alternate));
    }
    result.metadata.slots_evaluated = ranking.slots_evaluated;
    result.metadata.processing_time = elapsed;
    result.metadata.strategy = request.strategy;
    return result;
  }

  SchedulingLogEntry Orchestrator::successEntry(
      LogAction action, const ScheduleResult &result) const {
    SchedulingLogEntry entry;
    entry.interview_id = result.interview.id;
    entry.action = action;
    entry.success = true;
    entry.strategy = result.metadata.strategy;
    entry.slots_evaluated = result.metadata.slots_evaluated;
    entry.processing_time = result.metadata.processing_time;
    entry.best_score = result.slot.score;
    entry.alternates = result.alternates;
    entry.conflicts = result.slot.conflicts;
    return entry;
  }

  void Orchestrator::audit(SchedulingLogEntry entry) {
    {
      std::lock_guard lock{uuid_mutex_};
      entry.id = boost::uuids::to_string(uuid_());
    }
    entry.timestamp = deps_.clock->nowUTC();
    auto appended{deps_.audit->append(entry)};
    if (!appended) {
      log()->error("audit entry of interview {} not written: {}",
                   entry.interview_id.value_or("-"),
                   appended.error().message());
    }
  }

  void Orchestrator::auditFailure(
      LogAction action,
      Strategy strategy,
      const boost::optional<InterviewId> &interview_id,
      const SchedulingFailure &failure,
      milliseconds elapsed) {
    SchedulingLogEntry entry;
    entry.interview_id = interview_id;
    entry.action = action;
    entry.success = false;
    entry.strategy = strategy;
    entry.processing_time = elapsed;
    entry.errors = failure.errors;
    audit(std::move(entry));
  }

  void Orchestrator::notify(const Interview &interview) {
    InterviewScheduledEvent event;
    event.interview_id = interview.id;
    event.candidate_id = interview.candidate_id;
    event.job_id = interview.job_id;
    event.interview_type = interview.interview_type;
    event.scheduled = interview.scheduled;
    event.interviewers = interview.interviewers;
    event.duration_minutes = interview.duration_minutes;
    event.timezone = interview.timezone;
    event.conflicts = interview.conflicts_detected;
    auto published{deps_.events->publish(event)};
    if (!published) {
      log()->error("{} of interview {} not published: {}",
                   kInterviewScheduledTopic,
                   interview.id,
                   published.error().message());
    }
  }

  SchedulingFailure Orchestrator::gatherFailure(const std::error_code &error) {
    if (error == SchedulerError::kAvailabilityGatherTimeout) {
      return makeFailure(error);
    }
    return failureOf(
        SchedulerError::kSchedulingError,
        fmt::format("Availability read failed: {}", error.message()));
  }

  SchedulingFailure Orchestrator::interviewLookupFailure(
      const std::error_code &error) {
    if (error == RepositoryError::kNotFound) {
      return failureOf(SchedulerError::kInterviewNotFound,
                       "Interview not found");
    }
    return failureOf(
        SchedulerError::kSchedulingError,
        fmt::format("Interview not loaded: {}", error.message()));
  }
}  // namespace isched::scheduler
