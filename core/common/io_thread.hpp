/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>
#include <vector>

namespace isched {
  /**
   * Pool of threads running one io_context. Work posted to `io` runs on any
   * of the threads.
   */
  struct IoThreads {
    inline explicit IoThreads(size_t count)
        : io{std::make_shared<boost::asio::io_context>()},
          work{io->get_executor()} {
      if (count == 0) {
        count = 1;
      }
      threads.reserve(count);
      for (size_t i{0}; i < count; ++i) {
        threads.emplace_back([this] { io->run(); });
      }
    }
    inline ~IoThreads() {
      work.reset();
      io->stop();
      for (auto &thread : threads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
    }

    std::shared_ptr<boost::asio::io_context> io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work;
    std::vector<std::thread> threads;
  };
}  // namespace isched
