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
 * @file environmentPort.hpp
 * @brief Implements the visibility port on top of the process environment variables
 * @date 19/10/2026
 */

#pragma once

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/backends/genuine/visibilityPort.hpp>

namespace gpuq::backend::genuine
{

/**
 * Visibility port reading and writing the CUDA_VISIBLE_DEVICES and HIP_VISIBLE_DEVICES environment variables.
 *
 * \note The environment is process-global. Clearing and restoring is not synchronized with other threads or with anything
 *       else reading or writing these variables at the same time.
 */
class EnvironmentPort final : public VisibilityPort
{
  public:

  EnvironmentPort()  = default;
  ~EnvironmentPort() = default;

  /**
   * Gets the name of the environment variable holding a provider's allow-list
   *
   * @param[in] provider A single provider
   * @return The variable name, e.g., CUDA_VISIBLE_DEVICES
   */
  __INLINE__ static std::string getVariableName(const Provider provider) { return provider.getName() + "_VISIBLE_DEVICES"; }

  __INLINE__ snapshot_t read() override
  {
    snapshot_t snapshot;
    for (const auto p : Provider::universe())
    {
      const auto value = getenv(getVariableName(p).c_str());
      if (value != nullptr)
        snapshot[p] = std::string(value);
      else
        snapshot[p] = std::nullopt;
    }
    return snapshot;
  }

  __INLINE__ void clear() override
  {
    for (const auto p : Provider::universe())
      if (unsetenv(getVariableName(p).c_str()) != 0) GPUQ_THROW_RUNTIME("Could not unset %s: %s", getVariableName(p).c_str(), strerror(errno));
  }

  __INLINE__ void restore(const snapshot_t &snapshot) override
  {
    for (const auto &[provider, value] : snapshot)
    {
      if (value.has_value() == false) continue;

      // The scope is closing, so failing to restore can only be reported
      if (setenv(getVariableName(provider).c_str(), value->c_str(), 1) != 0)
        GPUQ_LOG_WARNING("Could not restore %s='%s': %s", getVariableName(provider).c_str(), value->c_str(), strerror(errno));
    }
  }
};

} // namespace gpuq::backend::genuine
