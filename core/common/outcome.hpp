/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

/**
 * OUTCOME_TRY propagates an error of outcome::result to the caller.
 * Supports 2 forms:
 * OUTCOME_TRY(expr);
 * OUTCOME_TRY(var, expr); // auto &&var = expr.value()
 */
#define OUTCOME_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

/**
 * Registers enum class as std::error_code enum. Goes to header after the enum
 * declaration, at global namespace scope.
 */
#define OUTCOME_HPP_DECLARE_ERROR(space, type)                 \
  namespace std {                                              \
    template <>                                                \
    struct is_error_code_enum<space::type> : std::true_type {}; \
  }                                                            \
  namespace space {                                            \
    std::error_code make_error_code(type);                     \
  }

/**
 * Defines error category for enum class registered with
 * OUTCOME_HPP_DECLARE_ERROR. Must be followed by function body returning
 * message for the enum value named `var`.
 */
#define OUTCOME_CPP_DEFINE_CATEGORY(space, type, var)                     \
  namespace space {                                                       \
    class type##Category final : public std::error_category {            \
     public:                                                              \
      const char *name() const noexcept override {                        \
        return #type;                                                     \
      }                                                                   \
      std::string message(int value) const override {                     \
        return toString(static_cast<type>(value));                        \
      }                                                                   \
      static std::string toString(type);                                  \
    };                                                                    \
    std::error_code make_error_code(type e) {                             \
      static const type##Category category{};                             \
      return {static_cast<int>(e), category};                             \
    }                                                                     \
  }                                                                       \
  std::string space::type##Category::toString(space::type var)

namespace isched::outcome {
  using BOOST_OUTCOME_V2_NAMESPACE::failure;
  using BOOST_OUTCOME_V2_NAMESPACE::success;

  template <typename T>
  using result = BOOST_OUTCOME_V2_NAMESPACE::std_result<T>;
}  // namespace isched::outcome
