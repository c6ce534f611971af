/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/optional/optional_io.hpp>

#include "common/io_thread.hpp"
#include "scheduler/impl/composite_availability_gateway.hpp"
#include "scheduler/impl/in_memory_availability_gateway.hpp"
#include "scheduler/impl/in_memory_entity_directory.hpp"
#include "scheduler/impl/in_memory_interview_repository.hpp"
#include "scheduler/impl/in_memory_scheduling_log.hpp"
#include "scheduler/impl/interview_store_availability_gateway.hpp"
#include "scheduler/impl/logging_event_publisher.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/mocks/scheduler/availability_gateway_mock.hpp"
#include "testutil/mocks/scheduler/entity_directory_mock.hpp"
#include "testutil/mocks/scheduler/event_publisher_mock.hpp"
#include "testutil/mocks/scheduler/interview_repository_mock.hpp"
#include "testutil/mocks/scheduler/scheduling_log_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/scheduler.hpp"

namespace isched::scheduler {
  using clock::UTCClockMock;
  using testing::_;
  using testing::ElementsAre;
  using testing::Invoke;
  using testing::Field;
  using testing::NiceMock;
  using testing::Return;
  using testutil::at;
  using testutil::booking;
  using testutil::busy;
  using testutil::interval;
  using testutil::starts;

  class OrchestratorTest : public ::testing::Test {
   protected:
    void SetUp() override {
      clock_->setNow(now_);
      directory_->addCandidate({"c1", "Jane Doe", "jane@example.com"});
      directory_->addJob({"j1", "Backend Engineer"});
      availability_ = std::make_shared<CompositeAvailabilityGateway>(
          std::vector<std::shared_ptr<AvailabilityGateway>>{
              calendar_,
              std::make_shared<InterviewStoreAvailabilityGateway>(
                  interviews_)});
    }

    OrchestratorDeps deps() const {
      return {clock_,
              std::make_shared<clock::TimezoneResolver>(),
              threads_.io,
              availability_,
              interviews_,
              directory_,
              audit_,
              events_};
    }

    std::shared_ptr<Orchestrator> orchestrator() const {
      return Orchestrator::create(config_, deps()).value();
    }

    /// Technical interview with alice and bob on Monday working hours
    SchedulingRequest request() const {
      SchedulingRequest request;
      request.candidate_id = "c1";
      request.job_id = "j1";
      request.interview_type = InterviewType::kTechnical;
      request.interviewers = {alice_, bob_};
      request.duration_minutes = 60;
      request.earliest_start = at("2024-01-15T09:00:00Z");
      request.latest_end = at("2024-01-15T17:00:00Z");
      request.timezone = "UTC";
      return request;
    }

    ParticipantId alice_{"alice@example.com"};
    ParticipantId bob_{"bob@example.com"};
    /// Friday before the requested Monday
    UnixTime now_{at("2024-01-12T00:00:00Z")};

    config::SchedulerConfig config_;
    IoThreads threads_{2};
    std::shared_ptr<NiceMock<UTCClockMock>> clock_{
        std::make_shared<NiceMock<UTCClockMock>>()};
    std::shared_ptr<InMemoryAvailabilityGateway> calendar_{
        std::make_shared<InMemoryAvailabilityGateway>()};
    std::shared_ptr<InMemoryInterviewRepository> interviews_{
        std::make_shared<InMemoryInterviewRepository>()};
    std::shared_ptr<InMemoryEntityDirectory> directory_{
        std::make_shared<InMemoryEntityDirectory>()};
    std::shared_ptr<InMemorySchedulingLog> log_{
        std::make_shared<InMemorySchedulingLog>()};
    std::shared_ptr<SchedulingLog> audit_{log_};
    std::shared_ptr<EventPublisher> events_{
        std::make_shared<LoggingEventPublisher>()};
    std::shared_ptr<AvailabilityGateway> availability_;
  };

  /**
   * @given free interviewers
   * @when scheduling interview
   * @then earliest best slot is booked and stored
   */
  TEST_F(OrchestratorTest, ScheduleFree) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(request()));

    const auto &interview{result.interview};
    EXPECT_FALSE(interview.id.empty());
    EXPECT_EQ(interview.version, 1);
    EXPECT_EQ(interview.status, InterviewStatus::kScheduled);
    EXPECT_EQ(interview.scheduled,
              interval("2024-01-15T09:00:00Z", "2024-01-15T10:00:00Z"));
    EXPECT_EQ(interview.title, "Technical Interview - Jane Doe");
    EXPECT_EQ(interview.description, "Interview for Backend Engineer position");
    EXPECT_EQ(interview.interviewers,
              (std::vector<ParticipantId>{alice_, bob_}));
    EXPECT_EQ(interview.primary_interviewer, alice_);
    EXPECT_EQ(interview.duration_minutes, 60);
    EXPECT_TRUE(interview.auto_scheduled);
    EXPECT_EQ(interview.created_at, now_);
    EXPECT_TRUE(interview.conflicts_detected.empty());

    EXPECT_DOUBLE_EQ(result.slot.score, 1.0);
    EXPECT_EQ(result.metadata.slots_evaluated, 15);
    EXPECT_EQ(result.metadata.strategy, Strategy::kBalanced);
    ASSERT_EQ(result.alternates.size(), 3);
    EXPECT_EQ(result.alternates[0].interval.start, at("2024-01-15T09:30:00Z"));
    EXPECT_LE(result.alternates[0].reasons.size(), 3);

    EXPECT_OUTCOME_TRUE(stored, interviews_->get(interview.id));
    EXPECT_EQ(stored.scheduled, interview.scheduled);

    auto entries{log_->entries()};
    ASSERT_EQ(entries.size(), 1);
    EXPECT_TRUE(entries[0].success);
    EXPECT_EQ(entries[0].action, LogAction::kSchedule);
    EXPECT_EQ(entries[0].interview_id, boost::make_optional(interview.id));
    EXPECT_EQ(entries[0].slots_evaluated, 15);
    EXPECT_EQ(entries[0].best_score, boost::make_optional(result.slot.score));
    EXPECT_EQ(entries[0].alternates.size(), 3);
    EXPECT_EQ(entries[0].timestamp, now_);
  }

  /**
   * @given both interviewers booked 10:00-11:00
   * @when scheduling interview
   * @then chosen slot and alternates avoid the booking
   */
  TEST_F(OrchestratorTest, AvoidsExistingBooking) {
    calendar_->addBooking(booking("b1",
                                  "2024-01-15T10:00:00Z",
                                  "2024-01-15T11:00:00Z",
                                  {alice_, bob_}));
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(request()));

    const auto booked{interval("2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z")};
    EXPECT_FALSE(result.interview.scheduled.overlaps(booked));
    EXPECT_EQ(result.interview.scheduled.start, at("2024-01-15T09:00:00Z"));
    EXPECT_TRUE(result.slot.conflicts.empty());
    EXPECT_EQ(result.metadata.slots_evaluated, 12);
    for (const auto &alternate : result.alternates) {
      EXPECT_FALSE(alternate.interval.overlaps(booked));
    }
    EXPECT_EQ(result.alternates[0].interval.start, at("2024-01-15T11:00:00Z"));
  }

  /**
   * @given interview booked by previous request
   * @when scheduling the same request again
   * @then new interview does not overlap the first one
   */
  TEST_F(OrchestratorTest, StoredInterviewsBlockSlots) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(first, engine->scheduleInterview(request()));
    EXPECT_OUTCOME_TRUE(second, engine->scheduleInterview(request()));
    EXPECT_NE(first.interview.id, second.interview.id);
    EXPECT_FALSE(
        second.interview.scheduled.overlaps(first.interview.scheduled));
    EXPECT_EQ(second.interview.scheduled.start, at("2024-01-15T10:00:00Z"));
  }

  /**
   * @given slot where only one interviewer is free
   * @when it is the only slot
   * @then interview is booked with available interviewer and conflicts
   */
  TEST_F(OrchestratorTest, PartialAvailability) {
    calendar_->addSlot(busy(
        alice_, "2024-01-15T09:00:00Z", "2024-01-15T10:00:00Z", "Dentist"));
    auto req{request()};
    req.latest_end = at("2024-01-15T10:00:00Z");
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(req));
    EXPECT_EQ(result.interview.interviewers, std::vector<ParticipantId>{bob_});
    EXPECT_EQ(result.interview.primary_interviewer, bob_);
    ASSERT_EQ(result.interview.conflicts_detected.size(), 1);
    EXPECT_EQ(result.interview.conflicts_detected[0].reason,
              "Busy: Dentist (09:00-10:00)");
    EXPECT_THAT(result.slot.reasons, testing::Contains("Has 1 conflicts"));
    EXPECT_LT(result.slot.score, result.slot.breakdown.combined);
  }

  /**
   * @given request breaking several rules
   * @when scheduling interview
   * @then every violation is reported and failure is audited
   */
  TEST_F(OrchestratorTest, ValidationListsAllErrors) {
    auto req{request()};
    req.candidate_id = "unknown";
    req.duration_minutes = 600;
    req.interviewers.clear();
    req.latest_end = req.earliest_start;
    auto engine{orchestrator()};
    EXPECT_SCHEDULING_FAILURE(
        failure, SchedulerError::kValidationFailed, engine->scheduleInterview(req));
    EXPECT_EQ(failure.errors,
              (std::vector<std::string>{
                  "Candidate not found",
                  "Earliest start time must be before latest end time",
                  "Duration must be between 15 minutes and 8 hours",
                  "At least one interviewer email is required"}));
    EXPECT_TRUE(interviews_->all().empty());

    auto entries{log_->entries()};
    ASSERT_EQ(entries.size(), 1);
    EXPECT_FALSE(entries[0].success);
    EXPECT_FALSE(entries[0].interview_id);
    EXPECT_EQ(entries[0].errors, failure.errors);
  }

  /**
   * @given unknown job and too short interview
   * @when scheduling interview
   * @then both errors are reported
   */
  TEST_F(OrchestratorTest, ValidationUnknownJob) {
    auto req{request()};
    req.job_id = "unknown";
    req.duration_minutes = 10;
    auto engine{orchestrator()};
    EXPECT_SCHEDULING_FAILURE(
        failure, SchedulerError::kValidationFailed, engine->scheduleInterview(req));
    EXPECT_EQ(failure.errors,
              (std::vector<std::string>{
                  "Job position not found",
                  "Duration must be between 15 minutes and 8 hours"}));
  }

  /**
   * @given window covering only a weekend
   * @when scheduling interview
   * @then no slot is found
   */
  TEST_F(OrchestratorTest, NoSlots) {
    auto req{request()};
    req.earliest_start = at("2024-01-13T00:00:00Z");
    req.latest_end = at("2024-01-15T00:00:00Z");
    auto engine{orchestrator()};
    EXPECT_SCHEDULING_FAILURE(
        failure, SchedulerError::kNoSlotsAvailable, engine->scheduleInterview(req));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{
                  "No suitable time slots found for the given constraints"});
    EXPECT_FALSE(retryable(failure.error));
  }

  /**
   * @given request without window and with repeated interviewer
   * @when scheduling interview
   * @then default window is searched and interviewer is booked once
   */
  TEST_F(OrchestratorTest, DefaultsApplied) {
    auto req{request()};
    req.earliest_start = {};
    req.latest_end = {};
    req.interviewers = {alice_, alice_, bob_};
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(req));
    EXPECT_EQ(result.interview.scheduled.start, at("2024-01-15T09:00:00Z"));
    EXPECT_EQ(result.interview.interviewers,
              (std::vector<ParticipantId>{alice_, bob_}));
  }

  /**
   * @given free interviewers
   * @when searching slots with different limits
   * @then limit is clamped and nothing is stored
   */
  TEST_F(OrchestratorTest, FindOptimalSlots) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(one, engine->findOptimalSlots(request(), 0));
    EXPECT_EQ(starts(one),
              std::vector<UnixTime>{at("2024-01-15T09:00:00Z")});
    EXPECT_OUTCOME_TRUE(five, engine->findOptimalSlots(request(), 5));
    EXPECT_EQ(five.size(), 5);
    EXPECT_OUTCOME_TRUE(all, engine->findOptimalSlots(request(), 1000));
    EXPECT_EQ(all.size(), 15);
    for (size_t i{1}; i < all.size(); ++i) {
      EXPECT_FALSE(ranksBefore(all[i], all[i - 1]));
    }
    EXPECT_TRUE(interviews_->all().empty());
    EXPECT_TRUE(log_->entries().empty());
  }

  /**
   * @given booking of one participant
   * @when checking overlapping interval
   * @then report lists conflict and available participant
   */
  TEST_F(OrchestratorTest, CheckConflicts) {
    calendar_->addBooking(booking(
        "b1", "2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z", {alice_}));
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(
        report,
        engine->checkConflicts(
            interval("2024-01-15T10:30:00Z", "2024-01-15T11:30:00Z"),
            {alice_, bob_}));
    EXPECT_EQ(report.total_conflicts, 1);
    EXPECT_EQ(report.affected_participants, 1);
    EXPECT_EQ(report.available, std::set<ParticipantId>{bob_});
    EXPECT_THAT(report.conflicts.at(alice_),
                ElementsAre(Field(&Conflict::reason,
                                  "Existing interview: Design review "
                                  "(10:00-11:00)")));

    EXPECT_SCHEDULING_FAILURE(
        failure,
        SchedulerError::kValidationFailed,
        engine->checkConflicts(
            interval("2024-01-15T11:00:00Z", "2024-01-15T10:00:00Z"), {}));
    EXPECT_EQ(failure.errors,
              (std::vector<std::string>{"Start time must be before end time",
                                        "At least one participant is required"}));
  }

  /**
   * @given calendars with bookings and markers
   * @when summarizing availability of a day
   * @then items starting inside the day are counted per participant
   */
  TEST_F(OrchestratorTest, AvailabilitySummary) {
    calendar_->addBooking(booking(
        "b1", "2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z", {alice_}));
    calendar_->addBooking(booking(
        "b2", "2024-01-14T23:00:00Z", "2024-01-15T01:00:00Z", {alice_}));
    calendar_->addSlot(
        busy(alice_, "2024-01-15T12:00:00Z", "2024-01-15T13:00:00Z"));
    calendar_->addSlot(
        busy(alice_, "2024-01-15T15:00:00Z", "2024-01-15T16:00:00Z"));
    auto open{busy(bob_, "2024-01-15T09:00:00Z", "2024-01-15T12:00:00Z")};
    open.type = AvailabilityType::kAvailable;
    calendar_->addSlot(open);

    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(
        summaries,
        engine->availabilitySummary(
            {alice_, bob_},
            interval("2024-01-15T00:00:00Z", "2024-01-16T00:00:00Z")));
    ASSERT_EQ(summaries.size(), 2);
    EXPECT_EQ(summaries[0].participant, alice_);
    EXPECT_EQ(summaries[0].total_interviews, 1);
    EXPECT_EQ(summaries[0].busy_slots, 2);
    EXPECT_EQ(summaries[0].available_slots, 0);
    EXPECT_EQ(summaries[0].working_hours.start_minute, 9 * 60);
    EXPECT_EQ(summaries[1].participant, bob_);
    EXPECT_EQ(summaries[1].total_interviews, 0);
    EXPECT_EQ(summaries[1].available_slots, 1);

    EXPECT_SCHEDULING_FAILURE(
        failure,
        SchedulerError::kValidationFailed,
        engine->availabilitySummary(
            {alice_}, interval("2024-01-16T00:00:00Z", "2024-01-15T00:00:00Z")));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{"Start date must be before end date"});
  }

  /**
   * @given scheduled interview
   * @when confirming, completing and confirming again
   * @then status follows allowed transitions only
   */
  TEST_F(OrchestratorTest, UpdateStatus) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(request()));
    const auto id{result.interview.id};

    EXPECT_OUTCOME_TRUE(confirmed,
                        engine->updateStatus(id, InterviewEvent::kConfirm));
    EXPECT_EQ(confirmed.status, InterviewStatus::kConfirmed);
    EXPECT_EQ(confirmed.version, 2);
    EXPECT_OUTCOME_TRUE(completed,
                        engine->updateStatus(id, InterviewEvent::kComplete));
    EXPECT_EQ(completed.status, InterviewStatus::kCompleted);

    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kUnknownTransition,
                              engine->updateStatus(id, InterviewEvent::kConfirm));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{
                  "Cannot confirm interview in status completed"});
    EXPECT_OUTCOME_TRUE(stored, interviews_->get(id));
    EXPECT_EQ(stored.status, InterviewStatus::kCompleted);

    EXPECT_SCHEDULING_FAILURE(
        missing,
        SchedulerError::kInterviewNotFound,
        engine->updateStatus("unknown", InterviewEvent::kCancel));
  }

  /**
   * @given scheduled interview
   * @when rescheduling it without new request
   * @then original is RESCHEDULED and replacement continues lineage
   */
  TEST_F(OrchestratorTest, Reschedule) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(scheduled, engine->scheduleInterview(request()));
    EXPECT_OUTCOME_TRUE(
        result,
        engine->rescheduleInterview(scheduled.interview.id, "Candidate ill"));

    EXPECT_EQ(result.reason, "Candidate ill");
    EXPECT_EQ(result.original.id, scheduled.interview.id);
    EXPECT_EQ(result.original.status, InterviewStatus::kRescheduled);
    EXPECT_EQ(result.original.reschedule_count, 1);
    EXPECT_EQ(result.original.reschedule_reason, "Candidate ill");

    const auto &replacement{result.replacement.interview};
    EXPECT_NE(replacement.id, scheduled.interview.id);
    EXPECT_EQ(replacement.status, InterviewStatus::kScheduled);
    EXPECT_EQ(replacement.original_interview_id,
              boost::make_optional(scheduled.interview.id));
    EXPECT_EQ(replacement.reschedule_count, 1);
    EXPECT_EQ(replacement.priority, Priority::kHigh);
    EXPECT_EQ(replacement.interviewers, scheduled.interview.interviewers);
    // the released original slot is free again
    EXPECT_EQ(replacement.scheduled.start, at("2024-01-15T09:00:00Z"));

    EXPECT_OUTCOME_TRUE(original, interviews_->get(scheduled.interview.id));
    EXPECT_EQ(original.status, InterviewStatus::kRescheduled);
    EXPECT_OUTCOME_TRUE_1(interviews_->get(replacement.id));

    auto entries{log_->entries()};
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[1].action, LogAction::kReschedule);
    EXPECT_TRUE(entries[1].success);
    EXPECT_EQ(entries[1].interview_id, boost::make_optional(replacement.id));
  }

  /**
   * @given interview rescheduled up to the limit through replacements
   * @when rescheduling the latest replacement
   * @then it is refused
   */
  TEST_F(OrchestratorTest, RescheduleLimitSpansLineage) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(scheduled, engine->scheduleInterview(request()));
    auto id{scheduled.interview.id};
    for (int attempt{1}; attempt <= config_.max_reschedule_attempts;
         ++attempt) {
      EXPECT_OUTCOME_TRUE(result, engine->rescheduleInterview(id, "moved"));
      EXPECT_EQ(result.replacement.interview.reschedule_count, attempt);
      id = result.replacement.interview.id;
    }
    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kCannotReschedule,
                              engine->rescheduleInterview(id, "moved"));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{"Interview cannot be rescheduled (too "
                                       "many attempts or not upcoming)"});
    EXPECT_OUTCOME_TRUE(latest, interviews_->get(id));
    EXPECT_EQ(latest.status, InterviewStatus::kScheduled);
  }

  /**
   * @given completed interview
   * @when rescheduling it
   * @then it is refused and nothing changes
   */
  TEST_F(OrchestratorTest, RescheduleCompleted) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(scheduled, engine->scheduleInterview(request()));
    const auto id{scheduled.interview.id};
    EXPECT_OUTCOME_TRUE_1(engine->updateStatus(id, InterviewEvent::kComplete));

    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kCannotReschedule,
                              engine->rescheduleInterview(id, "late"));
    EXPECT_EQ(interviews_->all().size(), 1);

    EXPECT_SCHEDULING_FAILURE(
        missing,
        SchedulerError::kInterviewNotFound,
        engine->rescheduleInterview("unknown", "late"));
  }

  /**
   * @given interview that already started
   * @when rescheduling it
   * @then it is refused
   */
  TEST_F(OrchestratorTest, RescheduleStarted) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(scheduled, engine->scheduleInterview(request()));
    clock_->setNow(scheduled.interview.scheduled.start + minutes{5});
    EXPECT_SCHEDULING_FAILURE(
        failure,
        SchedulerError::kCannotReschedule,
        engine->rescheduleInterview(scheduled.interview.id, "late"));
  }

  /**
   * @given new request for rescheduled interview
   * @when rescheduling
   * @then replacement follows the new request
   */
  TEST_F(OrchestratorTest, RescheduleWithRequest) {
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(scheduled, engine->scheduleInterview(request()));
    auto req{request()};
    req.earliest_start = at("2024-01-16T13:00:00Z");
    req.latest_end = at("2024-01-16T17:00:00Z");
    req.interviewers = {bob_};
    req.strategy = Strategy::kOptimizeCandidate;
    EXPECT_OUTCOME_TRUE(
        result,
        engine->rescheduleInterview(scheduled.interview.id, "moved", req));
    EXPECT_EQ(result.replacement.interview.scheduled.start,
              at("2024-01-16T13:00:00Z"));
    EXPECT_EQ(result.replacement.interview.interviewers,
              std::vector<ParticipantId>{bob_});
    EXPECT_EQ(result.replacement.metadata.strategy,
              Strategy::kOptimizeCandidate);
  }

  /**
   * @given event publisher failing
   * @when scheduling interview
   * @then interview stays stored and result is success
   */
  TEST_F(OrchestratorTest, NotificationFailureKeepsInterview) {
    auto events{std::make_shared<EventPublisherMock>()};
    EXPECT_CALL(*events,
                publish(Field(&InterviewScheduledEvent::candidate_id, "c1")))
        .WillOnce(Return(outcome::result<void>{
            std::make_error_code(std::errc::network_unreachable)}));
    events_ = events;
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(request()));
    EXPECT_OUTCOME_TRUE_1(interviews_->get(result.interview.id));
  }

  /**
   * @given audit log failing
   * @when scheduling interview
   * @then interview stays stored and result is success
   */
  TEST_F(OrchestratorTest, AuditFailureKeepsInterview) {
    auto audit{std::make_shared<SchedulingLogMock>()};
    EXPECT_CALL(*audit, append(Field(&SchedulingLogEntry::success, true)))
        .WillOnce(Return(outcome::result<void>{
            std::make_error_code(std::errc::io_error)}));
    audit_ = audit;
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(result, engine->scheduleInterview(request()));
    EXPECT_OUTCOME_TRUE_1(interviews_->get(result.interview.id));
  }

  /**
   * @given original changed by another writer between read and commit
   * @when rescheduling it
   * @then reschedule is refused as concurrent change
   */
  TEST_F(OrchestratorTest, RescheduleVersionConflict) {
    auto repository{std::make_shared<NiceMock<InterviewRepositoryMock>>()};
    Interview original;
    original.id = "i1";
    original.version = 1;
    original.candidate_id = "c1";
    original.job_id = "j1";
    original.interviewers = {alice_};
    original.duration_minutes = 60;
    original.timezone = "UTC";
    original.scheduled =
        interval("2024-01-15T09:00:00Z", "2024-01-15T10:00:00Z");
    EXPECT_CALL(*repository, get("i1")).WillRepeatedly(Return(original));
    EXPECT_CALL(*repository, reschedule(_, _))
        .WillOnce(Return(outcome::result<Interview>{
            RepositoryError::kVersionConflict}));
    availability_ = calendar_;
    auto deps{this->deps()};
    deps.interviews = repository;
    auto engine{Orchestrator::create(config_, deps).value()};

    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kCannotReschedule,
                              engine->rescheduleInterview("i1", "moved"));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{"Interview was changed concurrently"});
  }

  /**
   * @given directory slower than read timeout
   * @when scheduling interview
   * @then lookup times out as retryable failure
   */
  TEST_F(OrchestratorTest, LookupTimeout) {
    auto directory{std::make_shared<NiceMock<EntityDirectoryMock>>()};
    ON_CALL(*directory, getCandidate(_))
        .WillByDefault(testing::InvokeWithoutArgs([] {
          std::this_thread::sleep_for(milliseconds{200});
          return outcome::result<Candidate>{Candidate{"c1", "Jane", ""}};
        }));
    ON_CALL(*directory, getJob(_))
        .WillByDefault(Return(outcome::result<Job>{Job{"j1", "Backend"}}));
    config_.read_timeout = milliseconds{20};
    auto deps{this->deps()};
    deps.directory = directory;
    auto engine{Orchestrator::create(config_, deps).value()};
    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kAvailabilityGatherTimeout,
                              engine->scheduleInterview(request()));
    EXPECT_TRUE(retryable(failure.error));
  }

  /**
   * @given booking of one interviewer
   * @when searching slots
   * @then overlapping slot keeps the free interviewer at half availability
   * and ranks behind the fully available slot
   */
  TEST_F(OrchestratorTest, FindOptimalSlotsPartialAvailability) {
    calendar_->addBooking(
        booking("b1", "2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z", {bob_}));
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(slots, engine->findOptimalSlots(request(), 20));

    const auto position{[&](const std::string &start) {
      return static_cast<size_t>(
          std::find_if(slots.begin(),
                       slots.end(),
                       [&](const TimeSlot &slot) {
                         return slot.interval.start == at(start);
                       })
          - slots.begin());
    }};
    const auto nine{position("2024-01-15T09:00:00Z")};
    const auto ten{position("2024-01-15T10:00:00Z")};
    ASSERT_LT(nine, slots.size());
    ASSERT_LT(ten, slots.size());
    EXPECT_LT(nine, ten);

    EXPECT_DOUBLE_EQ(slots[nine].breakdown.availability_quality, 1.0);
    EXPECT_TRUE(slots[nine].participants_unavailable.empty());
    EXPECT_DOUBLE_EQ(slots[ten].breakdown.availability_quality, 0.5);
    EXPECT_EQ(slots[ten].participants_unavailable,
              std::set<ParticipantId>{bob_});
    EXPECT_EQ(slots[ten].participants_available,
              std::set<ParticipantId>{alice_});
  }

  /**
   * @given unchanged availability
   * @when searching slots twice with the same request
   * @then both rankings are identical
   */
  TEST_F(OrchestratorTest, FindOptimalSlotsRepeatable) {
    calendar_->addBooking(
        booking("b1", "2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z", {bob_}));
    calendar_->addSlot(busy(
        alice_, "2024-01-15T13:00:00Z", "2024-01-15T14:00:00Z", "Lunch"));
    auto engine{orchestrator()};
    EXPECT_OUTCOME_TRUE(first, engine->findOptimalSlots(request(), 20));
    EXPECT_OUTCOME_TRUE(second, engine->findOptimalSlots(request(), 20));

    ASSERT_EQ(first.size(), second.size());
    for (size_t i{0}; i < first.size(); ++i) {
      EXPECT_EQ(first[i].interval, second[i].interval) << i;
      EXPECT_DOUBLE_EQ(first[i].score, second[i].score) << i;
      EXPECT_EQ(first[i].reasons, second[i].reasons) << i;
      EXPECT_EQ(first[i].participants_available,
                second[i].participants_available)
          << i;
      ASSERT_EQ(first[i].conflicts.size(), second[i].conflicts.size()) << i;
      for (size_t j{0}; j < first[i].conflicts.size(); ++j) {
        EXPECT_EQ(first[i].conflicts[j].participant,
                  second[i].conflicts[j].participant);
        EXPECT_EQ(first[i].conflicts[j].reason, second[i].conflicts[j].reason);
        EXPECT_EQ(first[i].conflicts[j].window, second[i].conflicts[j].window);
      }
    }
  }

  /**
   * @given two requests for the same interviewer reading availability
   * before either commits
   * @when both schedule in parallel
   * @then interviews do not overlap
   */
  TEST_F(OrchestratorTest, ParallelSchedulesDoNotDoubleBook) {
    std::mutex mutex;
    std::condition_variable read_cv;
    size_t reads{0};
    auto slow{std::make_shared<NiceMock<AvailabilityGatewayMock>>()};
    ON_CALL(*slow, getBookings(_, _))
        .WillByDefault(Invoke([&](const std::vector<ParticipantId> &ids,
                                  const Interval &window) {
          auto bookings{availability_->getBookings(ids, window)};
          // hold until both requests have read bookings
          std::unique_lock lock{mutex};
          ++reads;
          read_cv.notify_all();
          read_cv.wait_for(lock, std::chrono::seconds{2}, [&] {
            return reads >= 2;
          });
          return bookings;
        }));
    ON_CALL(*slow, getBusySlots(_, _))
        .WillByDefault(Invoke([&](const std::vector<ParticipantId> &ids,
                                  const Interval &window) {
          return availability_->getBusySlots(ids, window);
        }));
    ON_CALL(*slow, getAvailableSlots(_, _))
        .WillByDefault(Invoke([&](const std::vector<ParticipantId> &ids,
                                  const Interval &window) {
          return availability_->getAvailableSlots(ids, window);
        }));
    IoThreads threads{4};
    auto deps{this->deps()};
    deps.io = threads.io;
    deps.availability = slow;
    auto engine{Orchestrator::create(config_, deps).value()};

    auto req{request()};
    req.interviewers = {alice_};
    auto schedule{[&] { return engine->scheduleInterview(req); }};
    auto first{std::async(std::launch::async, schedule)};
    auto second{std::async(std::launch::async, schedule)};
    EXPECT_OUTCOME_TRUE(a, first.get());
    EXPECT_OUTCOME_TRUE(b, second.get());

    EXPECT_FALSE(a.interview.scheduled.overlaps(b.interview.scheduled));
    EXPECT_EQ(interviews_->all().size(), 2);
  }

  /**
   * @given interview of an interviewer stored after the search read
   * availability
   * @when committing a replacement over the same time
   * @then reschedule fails as retryable scheduling error
   */
  TEST_F(OrchestratorTest, RescheduleSlotTaken) {
    auto repository{std::make_shared<NiceMock<InterviewRepositoryMock>>()};
    Interview original;
    original.id = "i1";
    original.version = 1;
    original.candidate_id = "c1";
    original.job_id = "j1";
    original.interviewers = {alice_};
    original.duration_minutes = 60;
    original.timezone = "UTC";
    original.scheduled =
        interval("2024-01-15T09:00:00Z", "2024-01-15T10:00:00Z");
    EXPECT_CALL(*repository, get("i1")).WillRepeatedly(Return(original));
    EXPECT_CALL(*repository, reschedule(_, _))
        .WillOnce(
            Return(outcome::result<Interview>{RepositoryError::kSlotTaken}));
    availability_ = calendar_;
    auto deps{this->deps()};
    deps.interviews = repository;
    auto engine{Orchestrator::create(config_, deps).value()};

    EXPECT_SCHEDULING_FAILURE(failure,
                              SchedulerError::kSchedulingError,
                              engine->rescheduleInterview("i1", "moved"));
    EXPECT_TRUE(retryable(failure.error));
    EXPECT_EQ(failure.errors,
              std::vector<std::string>{"Slot was taken concurrently"});
  }

  /**
   * @given invalid configuration or unknown working timezone
   * @when creating orchestrator
   * @then creation fails
   */
  TEST_F(OrchestratorTest, CreateRejectsConfig) {
    config_.scoring.weights.urgency_factor = 0.5;
    EXPECT_OUTCOME_ERROR(config::ConfigError::kInvalidWeights,
                         Orchestrator::create(config_, deps()));

    config_ = {};
    config_.working_hours.timezone = "Nowhere/Nothing";
    EXPECT_OUTCOME_ERROR(clock::TimezoneError::kUnknownTimezone,
                         Orchestrator::create(config_, deps()));
  }
}  // namespace isched::scheduler
