/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_SCHEDULER_AVAILABILITY_GATHERER_HPP
#define ISCHED_CORE_SCHEDULER_AVAILABILITY_GATHERER_HPP

#include <memory>

#include <boost/asio/io_context.hpp>

#include "scheduler/availability_gateway.hpp"
#include "scheduler/conflict_detector.hpp"

namespace isched::scheduler {
  using clock::milliseconds;

  /**
   * Reads calendars of participants in parallel on the worker pool and
   * merges them into one snapshot. Reads are independent, the whole gather
   * is bounded by timeout.
   */
  class AvailabilityGatherer {
   public:
    AvailabilityGatherer(std::shared_ptr<boost::asio::io_context> io,
                         std::shared_ptr<AvailabilityGateway> gateway,
                         milliseconds timeout);

    /**
     * @param participants - calendars to read
     * @param window - bookings and markers overlapping window are read
     * @param exclude_booking - booking id left out of snapshot
     * @return snapshot or kAvailabilityGatherTimeout, gateway error
     */
    outcome::result<AvailabilitySnapshot> gather(
        const std::vector<ParticipantId> &participants,
        const Interval &window,
        const boost::optional<std::string> &exclude_booking = boost::none)
        const;

   private:
    std::shared_ptr<boost::asio::io_context> io_;
    std::shared_ptr<AvailabilityGateway> gateway_;
    milliseconds timeout_;
  };
}  // namespace isched::scheduler

#endif  // ISCHED_CORE_SCHEDULER_AVAILABILITY_GATHERER_HPP
