/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ISCHED_CORE_FSM_FSM_HPP
#define ISCHED_CORE_FSM_FSM_HPP

#include <functional>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include "common/outcome.hpp"

#include "fsm/error.hpp"

/**
 * The namespace is related to a generic implementation of a finite state
 * machine
 */
namespace isched::fsm {

  /**
   * Container for state transitions caused by an event
   *
   * Initialization methods of the class could arise exceptions.
   * This is designed behavior due to the nature of further way of use.
   *
   * Initialization has to be done via
   * sequential calling from* and to* methods.
   *
   * @tparam EventEnumType - enum class with events listed
   * @tparam StateEnumType - enum class with states listed
   * @tparam Entity - type of entity to be tracked. Required for enabling
   * callbacks on transitions
   */
  template <typename EventEnumType, typename StateEnumType, typename Entity>
  class Transition final {
   public:
    /// Type alias for callback on state transition if set
    using ActionFunction =
        std::function<void(Entity & /* tracked entity */,
                           EventEnumType /* event that caused transition */,
                           StateEnumType /* transition source state */,
                           StateEnumType /* transition destination state */)>;

    /*
     * Initializers
     *
     * Throwing exceptions here is perfectly fine when the initialization is
     * hardcoded. Usually, it is.
     */

    /// Constructs transition map container for the \param event
    explicit Transition(EventEnumType event = {}) : event_{event} {}

    /// Set source state for a transition
    Transition &from(StateEnumType from_state) {
      if (not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      intermediary_.insert(from_state);
      return *this;
    }

    /// Set a list of source states for a transition
    template <typename... States>
    Transition &fromMany(States... states) {
      if (not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      (intermediary_.insert(states), ...);
      return *this;
    }

    /// Set destination state of a transition
    Transition &to(StateEnumType to_state) {
      if (intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state(s) are not set.");
      }
      for (auto from : intermediary_) {
        if (transitions_.end() != transitions_.find(from)) {
          throw std::runtime_error(
              "Event transition source state redefinition or "
              "destination state was not set.");
        }
        transitions_[from] = to_state;
      }
      intermediary_.clear();
      return *this;
    }

    /**
     * Set a callback to be called when state transition happens
     * @param callback - a function that takes four arguments:
     * 1. the entity
     * 2. event that triggered the transition
     * 3. transition source state
     * 4. transition destination state
     * @return self
     */
    Transition &action(ActionFunction callback) {
      if (transition_action_) {
        throw std::runtime_error("Transition callback is already set.");
      }
      transition_action_ = std::move(callback);
      return *this;
    }

    /// Getter for event identifier
    EventEnumType eventId() const {
      return event_;
    }

    /// Destination state for a given source state if there is a rule
    boost::optional<StateEnumType> target(StateEnumType from_state) const {
      auto lookup = transitions_.find(from_state);
      if (transitions_.end() == lookup) {
        return boost::none;
      }
      return lookup->second;
    }

    /**
     * Lookups if there is a transition for a given source state and applies
     * transition callback to the entity.
     *
     * @param from_state - transition source state
     * @param entity - entity the callback is applied to
     * @return resulting state if there is a transition rule
     */
    boost::optional<StateEnumType> dispatch(StateEnumType from_state,
                                            Entity &entity) const {
      auto to_state = target(from_state);
      if (to_state && transition_action_) {
        transition_action_.get()(entity, event_, from_state, *to_state);
      }
      return to_state;
    }

   private:
    EventEnumType event_;
    std::unordered_map<StateEnumType, StateEnumType> transitions_;
    std::set<StateEnumType> intermediary_;
    boost::optional<ActionFunction> transition_action_;
  };

  /**
   * Synchronous transition table. Holds no entity state itself, callers
   * own the entities and persist the resulting state.
   * @tparam EventEnumType - enum class with list of events
   * @tparam StateEnumType - enum class with list of states
   * @tparam Entity - type of handled objects
   */
  template <typename EventEnumType, typename StateEnumType, typename Entity>
  class TransitionTable {
   public:
    using TransitionRule = Transition<EventEnumType, StateEnumType, Entity>;

    explicit TransitionTable(std::vector<TransitionRule> transition_rules) {
      for (auto &rule : transition_rules) {
        auto event = rule.eventId();
        transitions_.emplace(event, std::move(rule));
      }
    }

    /// Whether the event is allowed in the state
    bool allows(StateEnumType from_state, EventEnumType event) const {
      return next(from_state, event).has_value();
    }

    /// Resulting state without applying callbacks
    outcome::result<StateEnumType> next(StateEnumType from_state,
                                        EventEnumType event) const {
      auto handler = transitions_.find(event);
      if (transitions_.end() == handler) {
        return FsmError::kUnknownEvent;
      }
      if (auto to_state = handler->second.target(from_state)) {
        return *to_state;
      }
      return FsmError::kNoTransition;
    }

    /**
     * Applies event to the entity in the given state, calling the transition
     * callback if one is set
     * @return resulting state
     */
    outcome::result<StateEnumType> apply(Entity &entity,
                                         StateEnumType from_state,
                                         EventEnumType event) const {
      auto handler = transitions_.find(event);
      if (transitions_.end() == handler) {
        return FsmError::kUnknownEvent;
      }
      if (auto to_state = handler->second.dispatch(from_state, entity)) {
        return *to_state;
      }
      return FsmError::kNoTransition;
    }

   private:
    /// a dispatching list of events and what to do on event
    std::unordered_map<EventEnumType, TransitionRule> transitions_;
  };

}  // namespace isched::fsm

#endif  // ISCHED_CORE_FSM_FSM_HPP
