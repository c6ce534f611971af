/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/conflict_detector.hpp"

#include <gtest/gtest.h>

#include "testutil/scheduler.hpp"

namespace isched::scheduler {
  using testutil::at;
  using testutil::booking;
  using testutil::busy;
  using testutil::interval;

  class ConflictDetectorTest : public ::testing::Test {
   protected:
    void SetUp() override {
      snapshot_.window =
          interval("2024-01-15T00:00:00Z", "2024-01-16T00:00:00Z");
      snapshot_.calendars[alice_].bookings.push_back(
          booking("b1",
                  "2024-01-15T10:00:00Z",
                  "2024-01-15T11:00:00Z",
                  {alice_}));
      snapshot_.calendars[bob_].busy.push_back(
          busy(bob_, "2024-01-15T12:00:00Z", "2024-01-15T13:00:00Z", "Lunch"));
      snapshot_.calendars[bob_].busy.push_back(
          busy(bob_, "2024-01-15T15:00:00Z", "2024-01-15T15:30:00Z"));
    }

    ParticipantId alice_{"alice@example.com"};
    ParticipantId bob_{"bob@example.com"};
    AvailabilitySnapshot snapshot_;
    ConflictDetector detector_;
  };

  /**
   * @given booking 10:00-11:00
   * @when checking slots touching and overlapping it
   * @then only overlapping slots conflict
   */
  TEST_F(ConflictDetectorTest, HalfOpenOverlap) {
    const std::vector<ParticipantId> participants{alice_};
    auto conflicts{[&](const std::string &start, const std::string &end) {
      return detector_.detect(interval(start, end), participants, snapshot_)
          .total();
    }};
    EXPECT_EQ(conflicts("2024-01-15T09:00:00Z", "2024-01-15T10:00:00Z"), 0);
    EXPECT_EQ(conflicts("2024-01-15T11:00:00Z", "2024-01-15T12:00:00Z"), 0);
    EXPECT_EQ(conflicts("2024-01-15T09:30:00Z", "2024-01-15T10:30:00Z"), 1);
    EXPECT_EQ(conflicts("2024-01-15T10:30:00Z", "2024-01-15T11:30:00Z"), 1);
    EXPECT_EQ(conflicts("2024-01-15T10:15:00Z", "2024-01-15T10:45:00Z"), 1);
  }

  /**
   * @given booking and busy markers with and without notes
   * @when detecting conflicts
   * @then reasons name the cause and its time
   */
  TEST_F(ConflictDetectorTest, Reasons) {
    auto booked{detector_.detect(
        interval("2024-01-15T10:30:00Z", "2024-01-15T11:30:00Z"),
        {alice_, bob_},
        snapshot_)};
    ASSERT_EQ(booked.by_participant.at(alice_).size(), 1);
    EXPECT_EQ(booked.by_participant.at(alice_)[0].reason,
              "Existing interview: Design review (10:00-11:00)");
    EXPECT_EQ(booked.by_participant.at(alice_)[0].window,
              interval("2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z"));
    EXPECT_EQ(booked.available, std::set<ParticipantId>{bob_});
    EXPECT_EQ(booked.unavailable, std::set<ParticipantId>{alice_});

    auto lunch{detector_.detect(
        interval("2024-01-15T12:30:00Z", "2024-01-15T13:30:00Z"),
        {bob_},
        snapshot_)};
    EXPECT_EQ(lunch.by_participant.at(bob_)[0].reason,
              "Busy: Lunch (12:00-13:00)");

    auto unnamed{detector_.detect(
        interval("2024-01-15T15:00:00Z", "2024-01-15T16:00:00Z"),
        {bob_},
        snapshot_)};
    EXPECT_EQ(unnamed.by_participant.at(bob_)[0].reason,
              "Busy: Unavailable (15:00-15:30)");
  }

  /**
   * @given participant missing in snapshot
   * @when detecting conflicts
   * @then participant is available
   */
  TEST_F(ConflictDetectorTest, UnknownParticipantAvailable) {
    auto conflicts{detector_.detect(
        interval("2024-01-15T10:00:00Z", "2024-01-15T11:00:00Z"),
        {"carol@example.com"},
        snapshot_)};
    EXPECT_EQ(conflicts.total(), 0);
    EXPECT_EQ(conflicts.available.count("carol@example.com"), 1);
  }

  /**
   * @given slot where one of two participants is busy
   * @when evaluating it
   * @then slot keeps available participant and conflicts of the other
   */
  TEST_F(ConflictDetectorTest, EvaluatePartial) {
    auto slot{detector_.evaluate(
        interval("2024-01-15T12:00:00Z", "2024-01-15T13:00:00Z"),
        {alice_, bob_},
        snapshot_)};
    ASSERT_TRUE(slot);
    EXPECT_EQ(slot->participants_available, std::set<ParticipantId>{alice_});
    EXPECT_EQ(slot->participants_unavailable, std::set<ParticipantId>{bob_});
    ASSERT_EQ(slot->conflicts.size(), 1);
    EXPECT_EQ(slot->conflicts[0].participant, bob_);
  }

  /**
   * @given slot where every participant is busy
   * @when evaluating it
   * @then slot is dropped
   */
  TEST_F(ConflictDetectorTest, EvaluateNobodyAvailable) {
    snapshot_.calendars[alice_].busy.push_back(
        busy(alice_, "2024-01-15T12:00:00Z", "2024-01-15T12:30:00Z"));
    EXPECT_FALSE(detector_.evaluate(
        interval("2024-01-15T12:00:00Z", "2024-01-15T13:00:00Z"),
        {alice_, bob_},
        snapshot_));
  }

  /**
   * @given weekly marker starting weeks before window
   * @when expanding it over two weeks
   * @then one occurrence per week falls inside window
   */
  TEST(ExpandRecurringTest, Weekly) {
    auto standup{busy("alice@example.com",
                      "2024-01-01T12:00:00Z",
                      "2024-01-01T13:00:00Z",
                      "Standup",
                      true)};
    auto one{expandRecurring(
        standup, interval("2024-01-15T00:00:00Z", "2024-01-20T00:00:00Z"))};
    ASSERT_EQ(one.size(), 1);
    EXPECT_EQ(one[0].interval,
              interval("2024-01-15T12:00:00Z", "2024-01-15T13:00:00Z"));
    EXPECT_EQ(one[0].notes, "Standup");

    auto two{expandRecurring(
        standup, interval("2024-01-15T00:00:00Z", "2024-01-29T00:00:00Z"))};
    ASSERT_EQ(two.size(), 2);
    EXPECT_EQ(two[1].interval.start, at("2024-01-22T12:00:00Z"));

    auto partial{expandRecurring(
        standup, interval("2024-01-22T12:30:00Z", "2024-01-22T18:00:00Z"))};
    ASSERT_EQ(partial.size(), 1);
    EXPECT_EQ(partial[0].interval.start, at("2024-01-22T12:00:00Z"));
  }

  /**
   * @given single marker
   * @when expanding it inside and outside window
   * @then it is returned unchanged only when it overlaps window
   */
  TEST(ExpandRecurringTest, Single) {
    auto meeting{busy("alice@example.com",
                      "2024-01-15T12:00:00Z",
                      "2024-01-15T13:00:00Z")};
    EXPECT_EQ(expandRecurring(meeting,
                              interval("2024-01-15T00:00:00Z",
                                       "2024-01-16T00:00:00Z"))
                  .size(),
              1);
    EXPECT_TRUE(expandRecurring(meeting,
                                interval("2024-01-22T00:00:00Z",
                                         "2024-01-23T00:00:00Z"))
                    .empty());
  }
}  // namespace isched::scheduler
