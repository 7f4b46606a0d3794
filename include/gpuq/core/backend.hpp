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
 * @brief Provides the abstract definition of a gpuq device data source (backend)
 * @date 19/10/2026
 */

#pragma once

#include <gpuq/core/definitions.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/provider.hpp>
#include <gpuq/core/visibility.hpp>

namespace gpuq
{

/**
 * Encapsulates a gpuq Backend: a swappable source of device descriptors.
 *
 * The query engine only ever talks to the currently active backend through the functions defined here. Backends need to fulfill
 * the abstract virtual functions described here, so that gpuq can detect GPU runtimes and devices.
 *
 * A backend holds no state beyond its own device universe and its visibility state.
 */
class Backend
{
  public:

  /**
   * Default destructor
   */
  virtual ~Backend() = default;

  /**
   * Checks whether the runtime of the given provider is installed, independently of how many devices it reports
   *
   * @param[in] provider A single provider
   * @return True, if the provider's runtime is available
   */
  __INLINE__ bool providerCheck(const Provider provider)
  {
    if (provider.isSingle() == false) GPUQ_THROW_LOGIC("Provider checks require exactly one provider, '%s' was passed", provider.getName().c_str());

    return providerCheckImpl(provider);
  }

  /**
   * Captures the current visibility state and, optionally, clears it while the returned scope is alive.
   *
   * Clearing makes count() report every device installed, rather than only the visible ones. The previous state is restored
   * when the returned scope is destroyed.
   *
   * @param[in] clear Whether to lift visibility restrictions for the lifetime of the scope
   * @return The scope, holding the visibility map that was active before clearing
   */
  [[nodiscard]] __INLINE__ VisibilityScope saveVisible(const bool clear = true) { return saveVisibleImpl(clear); }

  /**
   * Gets the number of devices reported under the currently active visibility state
   *
   * @return The device count
   */
  __INLINE__ int count() { return countImpl(); }

  /**
   * Fetches the descriptor of a device by its global ordinal
   *
   * @param[in] ordinal Global ordinal of the device, in [0, count()) when visibility is cleared
   * @return A freshly produced device descriptor
   */
  __INLINE__ Descriptor get(const int ordinal)
  {
    if (ordinal < 0) GPUQ_THROW_OUT_OF_RANGE("Invalid device index: %d", ordinal);

    return getImpl(ordinal);
  }

  /**
   * Makes this backend the active one for the calling thread, until replaced
   *
   * Defined in scope.hpp, reached through the includes at the end of this header
   *
   * @return The backend that was active before
   */
  inline Backend *activate();

  protected:

  Backend() = default;

  /**
   * Backend-specific implementation of the providerCheck function
   *
   * @param[in] provider A single provider
   * @return True, if the provider's runtime is available
   */
  virtual bool providerCheckImpl(const Provider provider) = 0;

  /**
   * Backend-specific implementation of the saveVisible function
   *
   * @param[in] clear Whether to lift visibility restrictions for the lifetime of the scope
   * @return The visibility scope
   */
  virtual VisibilityScope saveVisibleImpl(const bool clear) = 0;

  /**
   * Backend-specific implementation of the count function
   *
   * @return The device count
   */
  virtual int countImpl() = 0;

  /**
   * Backend-specific implementation of the get function. Must throw an out-of-range exception for ordinals past the last device.
   *
   * @param[in] ordinal A non-negative device ordinal
   * @return The device descriptor
   */
  virtual Descriptor getImpl(const int ordinal) = 0;
};

} // namespace gpuq

// Backend::activate() is defined after the default (genuine) backend is complete
#include <gpuq/backends/genuine/backend.hpp>
