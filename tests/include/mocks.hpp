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
 * @file mocks.hpp
 * @brief Provides test doubles for the native runtime and the visibility port of the genuine backend
 * @date 19/10/2026
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <utility>

#include <gpuq/backends/genuine/nativeRuntime.hpp>
#include <gpuq/backends/genuine/visibilityPort.hpp>

using namespace testing;

class MockNativeRuntime : public gpuq::backend::genuine::NativeRuntime
{
  public:

  MOCK_METHOD(bool, checkProvider, (const gpuq::Provider), (override));
  MOCK_METHOD(int, count, (), (override));
  MOCK_METHOD(gpuq::Descriptor, get, (const int), (override));
};

/* In-memory stand-in for the process environment. Counts clear and restore calls so tests can check the scope protocol. */
class MemoryVisibilityPort : public gpuq::backend::genuine::VisibilityPort
{
  public:

  MemoryVisibilityPort(std::optional<std::string> cuda = std::nullopt, std::optional<std::string> hip = std::nullopt)
  {
    values[gpuq::Provider::CUDA] = std::move(cuda);
    values[gpuq::Provider::HIP]  = std::move(hip);
  }

  snapshot_t read() override { return values; }

  void clear() override
  {
    for (auto &entry : values) entry.second = std::nullopt;
    clearCount++;
  }

  void restore(const snapshot_t &snapshot) override
  {
    for (const auto &[provider, value] : snapshot)
      if (value.has_value()) values[provider] = value;
    restoreCount++;
  }

  snapshot_t values;

  size_t clearCount = 0;

  size_t restoreCount = 0;
};

/*
 * Use a snippet like the following to emulate a machine with two CUDA devices:
 *
 *   auto runtime = std::make_shared<NiceMock<MockNativeRuntime>>();
 *   ON_CALL(*runtime, checkProvider(gpuq::Provider::CUDA)).WillByDefault(Return(true));
 *   ON_CALL(*runtime, count()).WillByDefault(Return(2));
 *   ON_CALL(*runtime, get(_)).WillByDefault(Invoke([](const int ord) { return makeDescriptor(ord, gpuq::Provider::CUDA, ord); }));
 */

inline gpuq::Descriptor makeDescriptor(const int ord, const gpuq::Provider provider, const int index, const std::string &name = "Test Device")
{
  gpuq::HardwareProperties hardware;
  hardware.major       = 8;
  hardware.minor       = 6;
  hardware.totalMemory = 1024;
  hardware.warpSize    = 32;
  return gpuq::Descriptor(ord, provider, index, name, hardware);
}
