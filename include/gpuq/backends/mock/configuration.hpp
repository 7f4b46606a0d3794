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
 * @file configuration.hpp
 * @brief Provides the configuration of the mock backend: device counts, visibility lists and the device template
 * @date 19/10/2026
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/provider.hpp>
#include <gpuq/core/visibility.hpp>

namespace gpuq::backend::mock
{

/**
 * Blueprint for the devices created by a mock backend. Every device gets the same hardware properties.
 */
struct DeviceTemplate
{
  /**
   * Name pattern. Every '{}' is replaced by the name of the device's provider
   */
  std::string name = "{} Mock Device";

  HardwareProperties hardware = getDefaultHardware();

  /**
   * Gets the name of a device of a given provider
   *
   * @param[in] provider A single provider
   * @return The name pattern with the provider name substituted
   */
  [[nodiscard]] __INLINE__ std::string getName(const Provider provider) const
  {
    const std::string placeholder = "{}";
    const auto        replacement = provider.getName();

    auto   output = name;
    size_t pos    = 0;
    while ((pos = output.find(placeholder, pos)) != std::string::npos)
    {
      output.replace(pos, placeholder.size(), replacement);
      pos += replacement.size();
    }

    return output;
  }

  /**
   * \return The hardware properties of a plausible, mid-range device
   */
  __INLINE__ static HardwareProperties getDefaultHardware()
  {
    HardwareProperties hardware;
    hardware.major             = 1;
    hardware.minor             = 2;
    hardware.totalMemory       = 8ul * 1024ul * 1024ul * 1024ul;
    hardware.smsCount          = 12;
    hardware.smThreads         = 2048;
    hardware.smSharedMemory    = 16ul * 1024ul;
    hardware.smRegisters       = 512;
    hardware.smBlocks          = 4;
    hardware.blockThreads      = 1024;
    hardware.blockSharedMemory = 8ul * 1024ul;
    hardware.blockRegisters    = 256;
    hardware.warpSize          = 32;
    hardware.l2CacheSize       = 8 * 1024 * 1024;
    hardware.concurrentKernels = true;
    hardware.asyncEnginesCount = 0;
    hardware.cooperative       = true;
    return hardware;
  }
};

/**
 * Describes the device universe of a mock backend.
 *
 * A count of std::nullopt means the provider's runtime is not installed, while a count of 0 means it is installed but reports
 * no device. A visibility list of std::nullopt means the provider's variable is not set.
 */
struct Configuration
{
  std::optional<int> cudaCount = 1;

  std::optional<int> hipCount;

  visibleList_t cudaVisible;

  visibleList_t hipVisible;

  DeviceTemplate deviceTemplate;

  /**
   * Builds a configuration out of the GPUQ_MOCK_CUDA_COUNT, GPUQ_MOCK_HIP_COUNT, GPUQ_MOCK_CUDA_VISIBLE and GPUQ_MOCK_HIP_VISIBLE
   * environment variables. Variables that are not set keep their default value.
   *
   * @return The configuration
   */
  __INLINE__ static Configuration fromEnvironment()
  {
    Configuration configuration;

    if (auto value = getenv("GPUQ_MOCK_CUDA_COUNT"); value != nullptr) configuration.cudaCount = parseCount("GPUQ_MOCK_CUDA_COUNT", value);
    if (auto value = getenv("GPUQ_MOCK_HIP_COUNT"); value != nullptr) configuration.hipCount = parseCount("GPUQ_MOCK_HIP_COUNT", value);
    if (auto value = getenv("GPUQ_MOCK_CUDA_VISIBLE"); value != nullptr) configuration.cudaVisible = parseIndexList("GPUQ_MOCK_CUDA_VISIBLE", value);
    if (auto value = getenv("GPUQ_MOCK_HIP_VISIBLE"); value != nullptr) configuration.hipVisible = parseIndexList("GPUQ_MOCK_HIP_VISIBLE", value);

    return configuration;
  }

  /**
   * Parses a device count. An empty value, 'none' or 'no' (in any case) mean the provider is not installed
   *
   * @param[in] variable Name of the variable the text was read from, used for error reporting
   * @param[in] text The raw value
   * @return The count, or std::nullopt for an absent provider
   */
  __INLINE__ static std::optional<int> parseCount(const std::string &variable, const std::string &text)
  {
    auto value = text;
    value.erase(0, std::min(value.find_first_not_of(" \t"), value.size()));
    value.erase(value.find_last_not_of(" \t") + 1);

    auto lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lowered.empty() || lowered == "none" || lowered == "no") return std::nullopt;

    int  count  = -1;
    auto result = std::from_chars(value.data(), value.data() + value.size(), count);
    if (result.ec != std::errc() || result.ptr != value.data() + value.size() || count < 0)
      GPUQ_THROW_VALIDATION("%s must be a non-negative integer or 'none', '%s' was passed", variable.c_str(), text.c_str());

    return count;
  }
};

} // namespace gpuq::backend::mock
