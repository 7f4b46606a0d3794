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
 * @file query.hpp
 * @brief Provides the device query engine: query, count, get and provider checks
 * @date 19/10/2026
 */

#pragma once

#include <vector>
#include <gpuq/core/backend.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/core/properties.hpp>
#include <gpuq/core/provider.hpp>
#include <gpuq/core/scope.hpp>
#include <gpuq/core/visibility.hpp>

namespace gpuq
{

/**
 * Describes what a query must find in order to succeed:
 *
 * - Nothing (default): the query never fails because of missing devices
 * - A provider mask: every provider in the mask must be installed and contribute at least one (visible) device
 * - Non-empty: at least one device must pass the provider filter
 */
class Requirement final
{
  public:

  /**
   * Builds an empty requirement
   */
  constexpr Requirement() = default;

  /**
   * Builds an exact per-provider requirement
   *
   * @param[in] mask The providers that must be present
   */
  constexpr Requirement(const Provider mask)
    : _mask(mask)
  {}

  /**
   * \return A requirement that is always satisfied
   */
  static constexpr Requirement none() { return Requirement(); }

  /**
   * Requires at least one device in the result. The provider mask is widened to ANY, so no specific runtime is required.
   *
   * \return The non-empty requirement
   */
  static constexpr Requirement nonEmpty()
  {
    Requirement r(Provider::ANY);
    r._nonEmpty = true;
    return r;
  }

  /**
   * \return The providers that must be present
   */
  [[nodiscard]] constexpr Provider getMask() const { return _mask; }

  /**
   * \return Whether the result must contain at least one device
   */
  [[nodiscard]] constexpr bool isNonEmpty() const { return _nonEmpty; }

  private:

  Provider _mask = Provider::ANY;

  bool _nonEmpty = false;
};

namespace detail
{

/**
 * Resolves the backend to use for a call
 *
 * @param[in] backend The explicitly passed backend, or nullptr
 * @return The explicit backend, or the one active on the calling thread
 */
__INLINE__ Backend *resolveBackend(Backend *backend) { return backend != nullptr ? backend : getBackend(); }

/**
 * Builds query results out of one descriptor and the visibility map it was enumerated under
 *
 * @param[in] descriptor The device descriptor
 * @param[in] scope The visibility scope active during enumeration
 * @param[in] backend The backend that produced the descriptor
 * @return The properties object, with its local index resolved
 */
__INLINE__ Properties makeProperties(Descriptor descriptor, const VisibilityScope &scope, const Backend *backend)
{
  const auto localIndex = globalToLocal(descriptor.index, scope.getVisibleList(descriptor.provider));
  return Properties(std::move(descriptor), localIndex, backend);
}

} // namespace detail

/**
 * Returns the devices matching the given criteria, in ascending ordinal order.
 *
 * Note: when Requirement::nonEmpty() is used, the "no devices" check applies to all devices reported by the backend while the
 * non-empty check applies to the filtered result.
 *
 * @param[in] provider Providers to include in the result. ANY means all
 * @param[in] required What must be found for the query to succeed
 * @param[in] visibleOnly Whether to leave out (and not count towards the requirement) devices hidden by *_VISIBLE_DEVICES
 * @param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * @return The matching devices
 */
__INLINE__ std::vector<Properties> query(const Provider provider = Provider::ANY, const Requirement required = Requirement(), const bool visibleOnly = true, Backend *backend = nullptr)
{
  auto b = detail::resolveBackend(backend);

  const auto filter   = provider.normalize();
  const auto nonEmpty = required.isNonEmpty();
  auto       missing  = required.getMask();

  GPUQ_LOG_DEBUG("Querying providers '%s' (required: '%s', non-empty: %d, visible only: %d)", filter.getName().c_str(), missing.getName().c_str(), nonEmpty, visibleOnly);

  // Checking the runtimes of the required providers before enumerating anything
  for (const auto p : Provider::universe())
    if (missing.contains(p) && b->providerCheck(p) == false) GPUQ_THROW_PROVIDER_UNAVAILABLE("GPU provider %s is not installed", p.getName().c_str());

  // Storage for the results
  std::vector<Properties> result;

  {
    // Lifting visibility restrictions, so that all devices are enumerated
    auto scope = b->saveVisible(true);

    const auto deviceCount = b->count();
    if (deviceCount == 0)
    {
      if (missing.isAny() == false || nonEmpty) GPUQ_THROW_NO_DEVICES("No GPUs detected");
      return result;
    }

    for (int ord = 0; ord < deviceCount; ord++)
    {
      auto properties = detail::makeProperties(b->get(ord), scope, b);

      // Hidden devices are skipped entirely
      if (visibleOnly && properties.isVisible() == false) continue;

      // The device's provider has been observed
      missing &= ~properties.getProvider();

      if (filter.contains(properties.getProvider())) result.push_back(std::move(properties));
    }
  }

  if (missing.isAny() == false) GPUQ_THROW_MISSING_PROVIDERS(missing.getMask(), "Could not find any GPU for the following required providers: %s", missing.getNames().c_str());
  if (nonEmpty && result.empty()) GPUQ_THROW_NO_SUITABLE_DEVICES("No suitable GPUs detected");

  GPUQ_LOG_DEBUG("Query returned %lu devices", result.size());

  return result;
}

/**
 * Returns the number of devices of the given providers
 *
 * @param[in] provider Providers to count. ANY and ALL count every device
 * @param[in] visibleOnly Whether to count only the devices visible by the current process
 * @param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * @return The device count
 */
__INLINE__ int count(const Provider provider = Provider::ALL, const bool visibleOnly = false, Backend *backend = nullptr)
{
  auto b = detail::resolveBackend(backend);

  if (provider.normalize() == Provider::ALL)
  {
    // Visible devices are what the backend reports under the ambient visibility state
    if (visibleOnly) return b->count();

    auto scope = b->saveVisible(true);
    return b->count();
  }

  return static_cast<int>(query(provider, Requirement::none(), visibleOnly, b).size());
}

/**
 * Returns one device, by its position among the devices of the given providers
 *
 * @param[in] idx Position of the device, in ascending ordinal order, among the matching devices
 * @param[in] provider Providers to consider. ANY and ALL consider every device
 * @param[in] visibleOnly Whether to consider only the devices visible by the current process
 * @param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * @return The device at position idx
 */
__INLINE__ Properties get(const int idx, const Provider provider = Provider::ALL, const bool visibleOnly = false, Backend *backend = nullptr)
{
  auto b = detail::resolveBackend(backend);

  // Without filters, the position is the ordinal
  if (provider.normalize() == Provider::ALL && visibleOnly == false)
  {
    auto scope = b->saveVisible(true);
    return detail::makeProperties(b->get(idx), scope, b);
  }

  auto devices = query(provider, Requirement::none(), visibleOnly, b);
  if (idx < 0 || static_cast<size_t>(idx) >= devices.size()) GPUQ_THROW_OUT_OF_RANGE("Invalid GPU index: %d (%lu devices match)", idx, devices.size());

  return devices[idx];
}

/**
 * Checks whether the runtime of a provider is installed
 *
 * @param[in] provider A single provider
 * @param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * @return True, if the runtime is available
 */
__INLINE__ bool hasProvider(const Provider provider, Backend *backend = nullptr) { return detail::resolveBackend(backend)->providerCheck(provider); }

/**
 * \param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * \return True, if the CUDA runtime is installed
 */
__INLINE__ bool hasCuda(Backend *backend = nullptr) { return hasProvider(Provider::CUDA, backend); }

/**
 * \param[in] backend Backend to query. nullptr means the backend active on the calling thread
 * \return True, if the HIP runtime is installed
 */
__INLINE__ bool hasHip(Backend *backend = nullptr) { return hasProvider(Provider::HIP, backend); }

} // namespace gpuq
