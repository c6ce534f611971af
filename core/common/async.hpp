/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <vector>

#include <boost/optional.hpp>

#include "common/outcome.hpp"

namespace isched {
  template <typename T>
  using CbT = std::function<void(outcome::result<T>)>;

  /**
   * Collects results of `n` independent calls. Callback is called once, either
   * with all values in call order or with the first error.
   */
  template <typename T>
  struct AsyncAll : std::enable_shared_from_this<AsyncAll<T>> {
    using Cb = CbT<std::vector<T>>;

    AsyncAll(int n, Cb cb) : n{n}, cb{std::move(cb)} {
      assert(n != 0);
      values.resize(n);
    }

    auto on(size_t i) {
      return [s{this->shared_from_this()}, i](auto _r) {
        if (!_r) {
          if (s->n.exchange(-1) > 0) {
            s->cb(_r.error());
          }
        } else {
          s->values[i] = std::move(_r.value());
          if (--s->n == 0) {
            s->cb(std::move(s->values));
          }
        }
      };
    }

    std::atomic<int> n;
    std::vector<T> values;
    Cb cb;
  };

  /**
   * Bridges callback style result into blocking wait with deadline.
   * Callback may outlive the waiter, late results are dropped.
   */
  template <typename T>
  class AsyncWait {
   public:
    AsyncWait()
        : state_{std::make_shared<State>()},
          future_{state_->promise.get_future()} {}

    CbT<T> callback() const {
      return [state{state_}](outcome::result<T> r) {
        if (!state->done.exchange(true)) {
          state->promise.set_value(std::move(r));
        }
      };
    }

    /// @return none if result was not delivered before timeout
    template <typename Rep, typename Period>
    boost::optional<outcome::result<T>> waitFor(
        std::chrono::duration<Rep, Period> timeout) {
      if (future_.wait_for(timeout) != std::future_status::ready) {
        return boost::none;
      }
      return future_.get();
    }

   private:
    struct State {
      std::promise<outcome::result<T>> promise;
      std::atomic_bool done{false};
    };

    std::shared_ptr<State> state_;
    std::future<outcome::result<T>> future_;
  };
}  // namespace isched
