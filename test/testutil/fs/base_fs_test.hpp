/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

namespace isched::test {
  namespace fs = boost::filesystem;

  /**
   * Test owning a scratch directory under system temp path. Directory is
   * created empty before each test and removed after it.
   */
  struct BaseFsTest : public ::testing::Test {
    explicit BaseFsTest(const std::string &name);

    void SetUp() override;

    void TearDown() override;

    /**
     * Writes file in test directory
     * @return full path of the file
     */
    std::string writeFile(const std::string &name,
                          const std::string &content) const;

    /// Path of a file in test directory, the file is not created
    std::string path(const std::string &name) const;

   protected:
    void clear();

    fs::path base_path;
  };
}  // namespace isched::test
