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
 * @file nativeRuntime.hpp
 * @brief Provides the abstract definition of the native device enumeration routine used by the genuine backend
 * @date 19/10/2026
 */

#pragma once

#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/provider.hpp>

namespace gpuq::backend::genuine
{

/**
 * Encapsulates the native routine that talks to the GPU runtimes installed on the system.
 *
 * Implementations report raw device information only; they know nothing about visibility scopes or queries. Device
 * enumeration is expected to honor the visibility state of the process at the time of the call.
 */
class NativeRuntime
{
  public:

  virtual ~NativeRuntime() = default;

  /**
   * Checks whether the runtime of a provider is installed and can be initialized
   *
   * @param[in] provider A single provider
   * @return True, if the runtime is available
   */
  virtual bool checkProvider(const Provider provider) = 0;

  /**
   * Counts the devices of every available provider
   *
   * @return The number of devices currently reported
   */
  virtual int count() = 0;

  /**
   * Reads the properties of one device
   *
   * @param[in] ordinal Global ordinal of the device. Devices of the first provider in canonical order come first
   * @return The device descriptor
   */
  virtual Descriptor get(const int ordinal) = 0;
};

} // namespace gpuq::backend::genuine
