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
 * @file backend.hpp
 * @brief Implements the mock backend, a deterministic in-memory device universe for tests and examples
 * @date 19/10/2026
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>
#include <gpuq/core/backend.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/provider.hpp>
#include <gpuq/core/visibility.hpp>
#include <gpuq/backends/mock/configuration.hpp>

namespace gpuq::backend::mock
{

/**
 * Backend over a fixed, synthetic set of devices:
 *
 * - CUDA devices take ordinals [0, cudaCount) and HIP devices take [cudaCount, cudaCount + hipCount)
 * - Every device is created out of the same template
 * - Visibility lists are private to the instance and never touch the process environment
 *
 * Nested saveVisible() calls on the same instance must not happen concurrently from different threads.
 */
class Backend final : public gpuq::Backend
{
  public:

  /**
   * Constructor
   *
   * @param[in] configuration The device universe and the initial visibility lists
   */
  Backend(const Configuration &configuration = Configuration())
    : gpuq::Backend(),
      _cudaCount(configuration.cudaCount),
      _hipCount(configuration.hipCount),
      _deviceTemplate(configuration.deviceTemplate)
  {
    if (_cudaCount.value_or(0) < 0) GPUQ_THROW_VALIDATION("The CUDA device count must not be negative, %d was passed", *_cudaCount);
    if (_hipCount.value_or(0) < 0) GPUQ_THROW_VALIDATION("The HIP device count must not be negative, %d was passed", *_hipCount);

    _cudaVisible = checkVisibleList(Provider::CUDA, configuration.cudaVisible);
    _hipVisible  = checkVisibleList(Provider::HIP, configuration.hipVisible);
  }

  ~Backend() = default;

  /**
   * \return The number of CUDA devices, or std::nullopt if the CUDA runtime is not installed
   */
  [[nodiscard]] __INLINE__ std::optional<int> getCudaCount() const { return _cudaCount; }

  /**
   * \return The number of HIP devices, or std::nullopt if the HIP runtime is not installed
   */
  [[nodiscard]] __INLINE__ std::optional<int> getHipCount() const { return _hipCount; }

  /**
   * Gets the visibility map currently in place, with the HIP list inheriting the CUDA one when unset
   *
   * \return The visibility map
   */
  [[nodiscard]] __INLINE__ Visibility getVisibility() const
  {
    auto hip = _hipVisible.has_value() ? _hipVisible : _cudaVisible;
    return Visibility{{Provider::CUDA, _cudaVisible}, {Provider::HIP, hip}};
  }

  /**
   * \return The number of devices constructed, regardless of visibility
   */
  [[nodiscard]] __INLINE__ int getTotalCount() const { return _cudaCount.value_or(0) + _hipCount.value_or(0); }

  protected:

  __INLINE__ bool providerCheckImpl(const Provider provider) override
  {
    if (provider == Provider::CUDA) return _cudaCount.has_value();
    return _hipCount.has_value();
  }

  __INLINE__ VisibilityScope saveVisibleImpl(const bool clear) override
  {
    auto visibility = getVisibility();

    if (clear == false) return VisibilityScope(std::move(visibility), nullptr);

    auto cuda = std::exchange(_cudaVisible, getAllIndices(_cudaCount));
    auto hip  = std::exchange(_hipVisible, getAllIndices(_hipCount));

    return VisibilityScope(std::move(visibility), [this, cuda = std::move(cuda), hip = std::move(hip)]() {
      _cudaVisible = cuda;
      _hipVisible  = hip;
    });
  }

  __INLINE__ int countImpl() override
  {
    const auto visibility = getVisibility();
    return countVisible(_cudaCount, getVisibleList(visibility, Provider::CUDA)) + countVisible(_hipCount, getVisibleList(visibility, Provider::HIP));
  }

  __INLINE__ Descriptor getImpl(const int ordinal) override
  {
    const auto cudaCount = _cudaCount.value_or(0);
    if (ordinal >= getTotalCount()) GPUQ_THROW_OUT_OF_RANGE("Invalid device index: %d (%d devices exist)", ordinal, getTotalCount());

    const auto provider = ordinal < cudaCount ? Provider::CUDA : Provider::HIP;
    const auto index    = ordinal < cudaCount ? ordinal : ordinal - cudaCount;

    return Descriptor(ordinal, provider, index, _deviceTemplate.getName(provider), _deviceTemplate.hardware);
  }

  private:

  __INLINE__ static visibleList_t checkVisibleList(const Provider provider, const visibleList_t &list)
  {
    if (list.has_value() == false) return std::nullopt;

    for (const auto index : *list)
      if (index < 0) GPUQ_THROW_VALIDATION("%s visibility list contains a negative index: %d", provider.getName().c_str(), index);

    return normalizeVisibleList(*list);
  }

  __INLINE__ static visibleList_t getAllIndices(const std::optional<int> count)
  {
    std::vector<int> indices;
    for (int i = 0; i < count.value_or(0); i++) indices.push_back(i);
    return indices;
  }

  __INLINE__ static int countVisible(const std::optional<int> count, const visibleList_t &list)
  {
    int visible = 0;
    for (int i = 0; i < count.value_or(0); i++)
      if (globalToLocal(i, list).has_value()) visible++;
    return visible;
  }

  const std::optional<int> _cudaCount;

  const std::optional<int> _hipCount;

  const DeviceTemplate _deviceTemplate;

  visibleList_t _cudaVisible;

  visibleList_t _hipVisible;
};

} // namespace gpuq::backend::mock
