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
 * @file visibilityPort.hpp
 * @brief Provides the abstract access point to the raw visibility variables of a process
 * @date 19/10/2026
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <gpuq/core/provider.hpp>

namespace gpuq::backend::genuine
{

/**
 * Narrow access point to the raw per-provider allow-list values (e.g., CUDA_VISIBLE_DEVICES).
 *
 * The genuine backend never touches the process environment directly; it does so through this interface.
 */
class VisibilityPort
{
  public:

  /**
   * Raw allow-list values, per provider. std::nullopt means the value is not set.
   */
  typedef std::map<Provider, std::optional<std::string>> snapshot_t;

  virtual ~VisibilityPort() = default;

  /**
   * Reads the current raw values
   *
   * @return One entry per provider in the universe
   */
  virtual snapshot_t read() = 0;

  /**
   * Unsets every value
   */
  virtual void clear() = 0;

  /**
   * Puts back the values that were set in a previous snapshot. Values that were not set are left untouched. Must not throw.
   *
   * @param[in] snapshot A snapshot obtained by read()
   */
  virtual void restore(const snapshot_t &snapshot) = 0;
};

} // namespace gpuq::backend::genuine
