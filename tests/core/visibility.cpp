/*
 *   Copyright 2025 Huawei Technologies Co., Ltd.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file visibility.cpp
 * @brief Unit tests for allow-list parsing, index translation and the visibility scope
 * @date 19/10/2026
 */

#include <stdexcept>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/visibility.hpp>

using gpuq::Provider;

TEST(Visibility, Parse)
{
  EXPECT_EQ(gpuq::parseVisibleList(Provider::CUDA, "0"), std::vector<int>({0}));
  EXPECT_EQ(gpuq::parseVisibleList(Provider::CUDA, "3,1,2"), std::vector<int>({1, 2, 3}));

  // Repetitions are dropped, blanks around tokens are tolerated
  EXPECT_EQ(gpuq::parseVisibleList(Provider::HIP, "1,1, 0 "), std::vector<int>({0, 1}));
}

TEST(Visibility, ParseFailure)
{
  EXPECT_THROW(gpuq::parseVisibleList(Provider::CUDA, ""), gpuq::ValidationException);
  EXPECT_THROW(gpuq::parseVisibleList(Provider::CUDA, "0,"), gpuq::ValidationException);
  EXPECT_THROW(gpuq::parseVisibleList(Provider::CUDA, "-1"), gpuq::ValidationException);
  EXPECT_THROW(gpuq::parseVisibleList(Provider::CUDA, "1a"), gpuq::ValidationException);
  EXPECT_THROW(gpuq::parseVisibleList(Provider::CUDA, "GPU-8f2a"), gpuq::ValidationException);

  // Failures are logic errors naming the variable and the offending token
  try
  {
    gpuq::parseVisibleList(Provider::HIP, "0,x");
    FAIL();
  }
  catch (const gpuq::LogicException &e)
  {
    EXPECT_NE(std::string(e.what()).find("HIP_VISIBLE_DEVICES"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("'x'"), std::string::npos);
  }
}

TEST(Visibility, Resolve)
{
  // Nothing set: unrestricted
  auto visibility = gpuq::resolveVisibility(std::nullopt, std::nullopt);
  EXPECT_FALSE(gpuq::getVisibleList(visibility, Provider::CUDA).has_value());
  EXPECT_FALSE(gpuq::getVisibleList(visibility, Provider::HIP).has_value());

  // HIP inherits the CUDA list when unset
  visibility = gpuq::resolveVisibility("1", std::nullopt);
  EXPECT_EQ(gpuq::getVisibleList(visibility, Provider::CUDA), std::vector<int>({1}));
  EXPECT_EQ(gpuq::getVisibleList(visibility, Provider::HIP), std::vector<int>({1}));

  // ...but not the other way around
  visibility = gpuq::resolveVisibility(std::nullopt, "0");
  EXPECT_FALSE(gpuq::getVisibleList(visibility, Provider::CUDA).has_value());
  EXPECT_EQ(gpuq::getVisibleList(visibility, Provider::HIP), std::vector<int>({0}));

  // Both set: independent
  visibility = gpuq::resolveVisibility("0", "1,2");
  EXPECT_EQ(gpuq::getVisibleList(visibility, Provider::CUDA), std::vector<int>({0}));
  EXPECT_EQ(gpuq::getVisibleList(visibility, Provider::HIP), std::vector<int>({1, 2}));

  // An invalid HIP value fails even if CUDA is valid
  EXPECT_THROW(gpuq::resolveVisibility("0", "a"), gpuq::ValidationException);
}

TEST(Visibility, GlobalToLocal)
{
  EXPECT_EQ(gpuq::globalToLocal(5, std::nullopt), 5);
  EXPECT_EQ(gpuq::globalToLocal(0, std::vector<int>({0, 2})), 0);
  EXPECT_EQ(gpuq::globalToLocal(2, std::vector<int>({0, 2})), 1);
  EXPECT_FALSE(gpuq::globalToLocal(1, std::vector<int>({0, 2})).has_value());
  EXPECT_FALSE(gpuq::globalToLocal(0, std::vector<int>()).has_value());
}

TEST(Visibility, Scope)
{
  int restored = 0;

  {
    gpuq::VisibilityScope scope(gpuq::resolveVisibility("1", std::nullopt), [&]() { restored++; });
    EXPECT_EQ(scope.getVisibleList(Provider::HIP), std::vector<int>({1}));

    // Moving the scope transfers the restore action
    gpuq::VisibilityScope moved(std::move(scope));
    EXPECT_EQ(restored, 0);
  }

  // Restored exactly once
  EXPECT_EQ(restored, 1);

  // Restored when leaving by an exception
  try
  {
    gpuq::VisibilityScope scope(gpuq::Visibility(), [&]() { restored++; });
    throw std::runtime_error("test");
  }
  catch (const std::runtime_error &)
  {}
  EXPECT_EQ(restored, 2);

  // No restore action is fine
  EXPECT_NO_THROW({ gpuq::VisibilityScope scope(gpuq::Visibility(), nullptr); });
}
