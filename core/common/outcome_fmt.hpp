/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <spdlog/fmt/fmt.h>

/**
 * Formats error code for logs and user messages:
 *   "{}"  - "CATEGORY:VALUE"
 *   "{:#}" - "CATEGORY error VALUE: \"MESSAGE\""
 */
template <>
struct fmt::formatter<std::error_code, char, void> {
  bool verbose{false};

  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    auto it{ctx.begin()};
    if (it != ctx.end() && *it == '#') {
      verbose = true;
      ++it;
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const std::error_code &e, FormatContext &ctx) const {
    if (!verbose) {
      return fmt::format_to(ctx.out(), "{}:{}", e.category().name(), e.value());
    }
    return fmt::format_to(ctx.out(),
                          "{} error {}: \"{}\"",
                          e.category().name(),
                          e.value(),
                          e.message());
  }
};
