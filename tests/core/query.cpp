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
 * @file query.cpp
 * @brief Unit tests for the device query engine, run against the mock backend
 * @date 19/10/2026
 */

#include <vector>
#include "gtest/gtest.h"
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/query.hpp>
#include <gpuq/backends/mock/backend.hpp>
#include "mocks.hpp"

using gpuq::Provider;
using gpuq::Requirement;

namespace
{

gpuq::backend::mock::Configuration makeConfiguration(std::optional<int> cudaCount,
                                                     std::optional<int> hipCount,
                                                     gpuq::visibleList_t cudaVisible = std::nullopt,
                                                     gpuq::visibleList_t hipVisible  = std::nullopt)
{
  gpuq::backend::mock::Configuration configuration;
  configuration.cudaCount   = cudaCount;
  configuration.hipCount    = hipCount;
  configuration.cudaVisible = cudaVisible;
  configuration.hipVisible  = hipVisible;
  return configuration;
}

} // namespace

TEST(Query, Runtimes)
{
  gpuq::backend::mock::Backend installed(makeConfiguration(0, 0));
  EXPECT_TRUE(gpuq::hasCuda(&installed));
  EXPECT_TRUE(gpuq::hasHip(&installed));

  gpuq::backend::mock::Backend missing(makeConfiguration(std::nullopt, std::nullopt));
  EXPECT_FALSE(gpuq::hasCuda(&missing));
  EXPECT_FALSE(gpuq::hasHip(&missing));
  EXPECT_FALSE(gpuq::hasProvider(Provider::CUDA, &missing));

  EXPECT_THROW(gpuq::hasProvider(Provider::ALL, &installed), gpuq::LogicException);
}

TEST(Query, Count)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(2, 3));
  gpuq::ScopedBackend          guard(&backend);

  EXPECT_EQ(gpuq::count(), 5);
  EXPECT_EQ(gpuq::count(Provider::ANY), 5);
  EXPECT_EQ(gpuq::count(Provider::ALL), 5);
  EXPECT_EQ(gpuq::count(Provider::CUDA), 2);
  EXPECT_EQ(gpuq::count(Provider::HIP), 3);
}

TEST(Query, Simple)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(1, 1));
  gpuq::ScopedBackend          guard(&backend);

  EXPECT_EQ(gpuq::count(), 2);
  EXPECT_EQ(gpuq::get(0).getProvider(), Provider::CUDA);
  EXPECT_EQ(gpuq::get(1).getProvider(), Provider::HIP);

  auto all = gpuq::query();
  ASSERT_EQ(all.size(), 2);
  EXPECT_EQ(all[0].getProvider(), Provider::CUDA);
  EXPECT_EQ(all[1].getProvider(), Provider::HIP);
  EXPECT_EQ(all[0].getBackend(), &backend);

  auto cuda = gpuq::query(Provider::CUDA);
  ASSERT_EQ(cuda.size(), 1);
  EXPECT_EQ(cuda[0].getProvider(), Provider::CUDA);

  auto hip = gpuq::query(Provider::HIP);
  ASSERT_EQ(hip.size(), 1);
  EXPECT_EQ(hip[0].getProvider(), Provider::HIP);
  EXPECT_EQ(hip[0].getName(), "HIP Mock Device");
}

TEST(Query, Ordering)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(2, 3));

  auto devices = gpuq::query(Provider::ANY, Requirement::none(), true, &backend);
  ASSERT_EQ(devices.size(), 5);
  for (size_t i = 0; i < devices.size(); i++) EXPECT_EQ(devices[i].getOrd(), static_cast<int>(i));

  EXPECT_EQ(devices[1].getIndex(), 1);
  EXPECT_EQ(devices[4].getIndex(), 2);
}

TEST(Query, GetVisible)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(2, std::nullopt, std::vector<int>({1})));
  gpuq::ScopedBackend          guard(&backend);

  EXPECT_EQ(gpuq::count(Provider::ALL, false), 2);
  EXPECT_EQ(gpuq::count(Provider::ALL, true), 1);

  auto g1 = gpuq::get(0, Provider::ALL, false);
  auto g2 = gpuq::get(1, Provider::ALL, false);

  EXPECT_FALSE(g1.isVisible());
  EXPECT_FALSE(g1.getIndex().has_value());
  EXPECT_EQ(g1.getSystemIndex(), 0);

  EXPECT_TRUE(g2.isVisible());
  EXPECT_EQ(g2.getIndex(), 0);
  EXPECT_EQ(g2.getSystemIndex(), 1);

  EXPECT_EQ(g2.getOrd(), gpuq::get(0, Provider::ALL, true).getOrd());
  EXPECT_THROW(gpuq::get(1, Provider::ALL, true), gpuq::OutOfRangeException);

  // Hidden devices are reported only on request
  EXPECT_EQ(gpuq::query(Provider::ANY, Requirement::none(), true).size(), 1);
  EXPECT_EQ(gpuq::query(Provider::ANY, Requirement::none(), false).size(), 2);

  // The backend visibility state is untouched by queries
  EXPECT_EQ(backend.count(), 1);
}

TEST(Query, VisibleHipFromCuda)
{
  // HIP follows CUDA_VISIBLE_DEVICES when HIP_VISIBLE_DEVICES is not set
  gpuq::backend::mock::Backend inherited(makeConfiguration(std::nullopt, 2, std::vector<int>({0})));
  EXPECT_EQ(gpuq::count(Provider::ALL, true, &inherited), 1);

  gpuq::backend::mock::Backend independent(makeConfiguration(std::nullopt, 2, std::vector<int>({0}), std::vector<int>({0, 1})));
  EXPECT_EQ(gpuq::count(Provider::ALL, true, &independent), 2);
}

TEST(Query, VisibleHipFromCudaMixed)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(2, 2, std::vector<int>({1})));
  gpuq::ScopedBackend          guard(&backend);

  EXPECT_EQ(gpuq::count(Provider::ALL, false), 4);
  EXPECT_EQ(gpuq::count(Provider::ALL, true), 2);

  EXPECT_EQ(gpuq::count(Provider::CUDA, false), 2);
  EXPECT_EQ(gpuq::count(Provider::HIP, false), 2);

  EXPECT_EQ(gpuq::count(Provider::CUDA, true), 1);
  EXPECT_EQ(gpuq::count(Provider::HIP, true), 1);

  auto cuda = gpuq::get(0, Provider::CUDA, true);
  auto hip  = gpuq::get(0, Provider::HIP, true);
  EXPECT_EQ(hip.getIndex(), cuda.getIndex());
  EXPECT_EQ(hip.getSystemIndex(), cuda.getSystemIndex());
}

TEST(Query, Filtering)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(1, 0));
  gpuq::ScopedBackend          guard(&backend);

  EXPECT_FALSE(gpuq::query(Provider::ANY).empty());
  EXPECT_FALSE(gpuq::query(Provider::CUDA).empty());

  EXPECT_TRUE(gpuq::query(Provider::HIP).empty());

  // A satisfied requirement does not imply a non-empty result
  EXPECT_TRUE(gpuq::query(Provider::HIP, Provider::CUDA).empty());

  EXPECT_THROW(gpuq::query(Provider::HIP, Provider::HIP), gpuq::MissingProvidersException);
  EXPECT_THROW(gpuq::query(Provider::HIP, Requirement::nonEmpty()), gpuq::NoSuitableDevicesException);
  EXPECT_THROW(gpuq::query(Provider::CUDA, Provider::HIP), gpuq::MissingProvidersException);

  // Every failure is a runtime error
  EXPECT_THROW(gpuq::query(Provider::HIP, Provider::HIP), gpuq::RuntimeException);
}

TEST(Query, MissingProviders)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(1, 0));

  try
  {
    gpuq::query(Provider::ANY, Provider::ALL, true, &backend);
    FAIL();
  }
  catch (const gpuq::MissingProvidersException &e)
  {
    EXPECT_EQ(e.getMissingMask(), Provider::HIP.getMask());
  }

  // Hidden devices do not satisfy a requirement when only visible ones are considered
  gpuq::backend::mock::Backend hidden(makeConfiguration(2, std::nullopt, std::vector<int>()));
  EXPECT_THROW(gpuq::query(Provider::ANY, Provider::CUDA, true, &hidden), gpuq::MissingProvidersException);
  EXPECT_EQ(gpuq::query(Provider::ANY, Provider::CUDA, false, &hidden).size(), 2);
}

TEST(Query, ProviderUnavailable)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(1, std::nullopt));

  // Runtimes are checked before enumerating
  EXPECT_THROW(gpuq::query(Provider::ANY, Provider::HIP, true, &backend), gpuq::ProviderUnavailableException);
  EXPECT_THROW(gpuq::query(Provider::ANY, Provider::ALL, true, &backend), gpuq::ProviderUnavailableException);

  // Not requiring the missing runtime is fine
  EXPECT_EQ(gpuq::query(Provider::HIP, Requirement::none(), true, &backend).size(), 0);
}

TEST(Query, NoDevices)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(0, 0));

  EXPECT_TRUE(gpuq::query(Provider::ANY, Requirement::none(), true, &backend).empty());
  EXPECT_THROW(gpuq::query(Provider::ANY, Provider::CUDA, true, &backend), gpuq::NoDevicesException);
  EXPECT_THROW(gpuq::query(Provider::ANY, Requirement::nonEmpty(), true, &backend), gpuq::NoDevicesException);
}

TEST(Query, NonEmpty)
{
  // The non-empty requirement does not need any particular runtime
  gpuq::backend::mock::Backend backend(makeConfiguration(std::nullopt, 1));
  EXPECT_EQ(gpuq::query(Provider::ANY, Requirement::nonEmpty(), true, &backend).size(), 1);

  EXPECT_TRUE(Requirement::nonEmpty().isNonEmpty());
  EXPECT_TRUE(Requirement::nonEmpty().getMask().isAny());
  EXPECT_FALSE(Requirement::none().isNonEmpty());
  EXPECT_EQ(Requirement(Provider::HIP).getMask(), Provider::HIP);
}

TEST(Query, GetBounds)
{
  gpuq::backend::mock::Backend backend(makeConfiguration(2, 1));

  for (const auto p : {Provider::ANY, Provider::CUDA, Provider::HIP})
  {
    const auto n = gpuq::count(p, true, &backend);
    ASSERT_GT(n, 0);
    EXPECT_NO_THROW(gpuq::get(0, p, true, &backend));
    EXPECT_THROW(gpuq::get(n, p, true, &backend), gpuq::OutOfRangeException);
    EXPECT_THROW(gpuq::get(-1, p, true, &backend), gpuq::OutOfRangeException);
  }

  // Unfiltered lookups go straight to the backend
  EXPECT_THROW(gpuq::get(3, Provider::ALL, false, &backend), gpuq::OutOfRangeException);
  EXPECT_THROW(gpuq::get(-1, Provider::ALL, false, &backend), gpuq::OutOfRangeException);
}

TEST(Query, Equality)
{
  // Two backends with the same universe produce equivalent devices
  gpuq::backend::mock::Backend a(makeConfiguration(1, std::nullopt));
  gpuq::backend::mock::Backend b(makeConfiguration(1, std::nullopt));

  EXPECT_EQ(gpuq::get(0, Provider::ALL, false, &a), gpuq::get(0, Provider::ALL, false, &b));
  EXPECT_EQ(gpuq::get(0, Provider::ALL, false, &a), gpuq::get(0, Provider::ALL, false, &a));
}

TEST(Query, ValidationFailure)
{
  // Invalid visibility values surface from the genuine backend before anything is enumerated
  auto runtime = std::make_shared<StrictMock<MockNativeRuntime>>();
  auto port    = std::make_shared<MemoryVisibilityPort>(std::string("x"));
  gpuq::backend::genuine::Backend backend(runtime, port);

  EXPECT_THROW(gpuq::query(Provider::ANY, Requirement::none(), true, &backend), gpuq::ValidationException);
  EXPECT_THROW(gpuq::count(Provider::ALL, false, &backend), gpuq::ValidationException);
}
