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
 * @file properties.hpp
 * @brief Provides the query result class: a device descriptor enriched with its visibility context
 * @date 19/10/2026
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/provider.hpp>

namespace gpuq
{

class Backend;

/**
 * This class represents one device as returned by a query:
 *
 * - The descriptor, as produced by the backend
 * - The index of the device as seen by the calling process (std::nullopt if the device is not visible)
 * - The backend that produced it
 *
 * This is an immutable snapshot: visibility is determined at construction time and does not reflect later changes.
 */
class Properties final
{
  public:

  /**
   * Constructor
   *
   * @param[in] descriptor The device descriptor
   * @param[in] localIndex Process-local index of the device, if visible
   * @param[in] backend The backend that produced the descriptor (non-owning, used for identity only)
   */
  Properties(Descriptor descriptor, const std::optional<int> localIndex, const Backend *backend)
    : _descriptor(std::move(descriptor)),
      _localIndex(localIndex),
      _backend(backend)
  {}

  ~Properties() = default;

  /**
   * Ordinal of the device, across all providers and devices
   *
   * \return The ordinal
   */
  [[nodiscard]] __INLINE__ int getOrd() const { return _descriptor.ord; }

  /**
   * Which runtime provides the device
   *
   * \return The provider (a single provider bit)
   */
  [[nodiscard]] __INLINE__ Provider getProvider() const { return _descriptor.provider; }

  /**
   * Index of the device as seen by the calling process, affected by the *_VISIBLE_DEVICES variables. Provider-specific.
   *
   * \return The local index, or std::nullopt if the device is not visible by this process
   */
  [[nodiscard]] __INLINE__ std::optional<int> getIndex() const { return _localIndex; }

  /**
   * System-wide index of the device, i.e., its index when ignoring *_VISIBLE_DEVICES. Provider-specific.
   *
   * \return The system index
   */
  [[nodiscard]] __INLINE__ int getSystemIndex() const { return _descriptor.index; }

  /**
   * Whether the device was visible by the current process when this object was created
   *
   * \return True, if a local index exists
   */
  [[nodiscard]] __INLINE__ bool isVisible() const { return _localIndex.has_value(); }

  /**
   * \return The backend which produced this device
   */
  [[nodiscard]] __INLINE__ const Backend *getBackend() const { return _backend; }

  /**
   * \return The underlying device descriptor
   */
  [[nodiscard]] __INLINE__ const Descriptor &getDescriptor() const { return _descriptor; }

  [[nodiscard]] __INLINE__ const std::string &getName() const { return _descriptor.name; }
  [[nodiscard]] __INLINE__ int getMajor() const { return _descriptor.hardware.major; }
  [[nodiscard]] __INLINE__ int getMinor() const { return _descriptor.hardware.minor; }
  [[nodiscard]] __INLINE__ size_t getTotalMemory() const { return _descriptor.hardware.totalMemory; }
  [[nodiscard]] __INLINE__ int getSmsCount() const { return _descriptor.hardware.smsCount; }
  [[nodiscard]] __INLINE__ int getSmThreads() const { return _descriptor.hardware.smThreads; }
  [[nodiscard]] __INLINE__ size_t getSmSharedMemory() const { return _descriptor.hardware.smSharedMemory; }
  [[nodiscard]] __INLINE__ int getSmRegisters() const { return _descriptor.hardware.smRegisters; }
  [[nodiscard]] __INLINE__ int getSmBlocks() const { return _descriptor.hardware.smBlocks; }
  [[nodiscard]] __INLINE__ int getBlockThreads() const { return _descriptor.hardware.blockThreads; }
  [[nodiscard]] __INLINE__ size_t getBlockSharedMemory() const { return _descriptor.hardware.blockSharedMemory; }
  [[nodiscard]] __INLINE__ int getBlockRegisters() const { return _descriptor.hardware.blockRegisters; }
  [[nodiscard]] __INLINE__ int getWarpSize() const { return _descriptor.hardware.warpSize; }
  [[nodiscard]] __INLINE__ int getL2CacheSize() const { return _descriptor.hardware.l2CacheSize; }
  [[nodiscard]] __INLINE__ bool getConcurrentKernels() const { return _descriptor.hardware.concurrentKernels; }
  [[nodiscard]] __INLINE__ int getAsyncEnginesCount() const { return _descriptor.hardware.asyncEnginesCount; }
  [[nodiscard]] __INLINE__ bool getCooperative() const { return _descriptor.hardware.cooperative; }

  /**
   * Serialization function for reporting purposes
   *
   * @param[in] stripIndex Whether to leave out the ordinal and both indices
   * @return JSON-formatted device information
   */
  [[nodiscard]] __INLINE__ nlohmann::json serialize(const bool stripIndex = false) const
  {
    nlohmann::json output;

    if (stripIndex == false) output["ord"] = _descriptor.ord;
    output["provider"] = _descriptor.provider.getName();
    if (stripIndex == false)
    {
      if (_localIndex.has_value())
        output["index"] = *_localIndex;
      else
        output["index"] = nullptr;
      output["system_index"] = _descriptor.index;
    }
    output["name"] = _descriptor.name;
    _descriptor.hardware.serialize(output);

    return output;
  }

  /**
   * Two properties are equivalent if they come from the same backend and have the same local index. Otherwise, they are compared
   * by all their fields except the ordinal and the indices.
   *
   * To check whether two objects describe the same physical device, compare their system indices and providers instead.
   *
   * @param[in] other The properties to compare against
   * @return True, if both describe equivalent devices
   */
  __INLINE__ bool operator==(const Properties &other) const
  {
    if (_backend == other._backend && _localIndex == other._localIndex) return true;
    return serialize(true) == other.serialize(true);
  }

  __INLINE__ bool operator!=(const Properties &other) const { return !(*this == other); }

  /**
   * Gets a short identification string, e.g. gpuq::Properties(CUDA[1 -> 0], 'Mock Device')
   *
   * @return The identification string
   */
  [[nodiscard]] __INLINE__ std::string getIdentifier() const
  {
    const auto localIndex = _localIndex.has_value() ? std::to_string(*_localIndex) : std::string("None");
    return std::string("gpuq::Properties(") + _descriptor.provider.getName() + "[" + std::to_string(_descriptor.index) + " -> " + localIndex + "], '" +
           _descriptor.name + "')";
  }

  /**
   * Gets a multi-line, human-readable rendering of the device
   *
   * @return The identification string followed by one indented line per hardware field
   */
  [[nodiscard]] __INLINE__ std::string toString() const
  {
    auto fields = serialize(true);
    fields.erase("provider");
    fields.erase("name");

    // Keeping the hardware field order, since JSON objects are sorted by key
    static const char *const order[] = {"major",
                                        "minor",
                                        "total_memory",
                                        "sms_count",
                                        "sm_threads",
                                        "sm_shared_memory",
                                        "sm_registers",
                                        "sm_blocks",
                                        "block_threads",
                                        "block_shared_memory",
                                        "block_registers",
                                        "warp_size",
                                        "l2_cache_size",
                                        "concurrent_kernels",
                                        "async_engines_count",
                                        "cooperative"};

    std::string output = getIdentifier() + "{\n";
    for (const auto key : order) output += std::string("    ") + key + ": " + fields[key].dump() + "\n";
    output += "}";

    return output;
  }

  private:

  Descriptor _descriptor;

  std::optional<int> _localIndex;

  const Backend *_backend;
};

__INLINE__ std::ostream &operator<<(std::ostream &os, const Properties &properties) { return os << properties.toString(); }

} // namespace gpuq
