// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <spinalg/utils/logger.hpp>

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  spinalg::utils::Logger::set_level(spdlog::level::err);
  return RUN_ALL_TESTS();
}
