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
 * @file descriptor.hpp
 * @brief Provides the device descriptor record reported by gpuq backends
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/provider.hpp>

namespace gpuq
{

/**
 * Hardware properties of a device, as reported by the native runtime.
 *
 * gpuq does not interpret these values, it only passes them through.
 */
struct HardwareProperties
{
  int    major             = 0;
  int    minor             = 0;
  size_t totalMemory       = 0;
  int    smsCount          = 0;
  int    smThreads         = 0;
  size_t smSharedMemory    = 0;
  int    smRegisters       = 0;
  int    smBlocks          = 0;
  int    blockThreads      = 0;
  size_t blockSharedMemory = 0;
  int    blockRegisters    = 0;
  int    warpSize          = 0;
  int    l2CacheSize       = 0;
  bool   concurrentKernels = false;
  int    asyncEnginesCount = 0;
  bool   cooperative       = false;

  bool operator==(const HardwareProperties &) const = default;

  /**
   * Serializes the hardware properties into the given JSON object, using snake_case keys
   *
   * @param[out] output The JSON object to add the fields to
   */
  __INLINE__ void serialize(nlohmann::json &output) const
  {
    output["major"]               = major;
    output["minor"]               = minor;
    output["total_memory"]        = totalMemory;
    output["sms_count"]           = smsCount;
    output["sm_threads"]          = smThreads;
    output["sm_shared_memory"]    = smSharedMemory;
    output["sm_registers"]        = smRegisters;
    output["sm_blocks"]           = smBlocks;
    output["block_threads"]       = blockThreads;
    output["block_shared_memory"] = blockSharedMemory;
    output["block_registers"]     = blockRegisters;
    output["warp_size"]           = warpSize;
    output["l2_cache_size"]       = l2CacheSize;
    output["concurrent_kernels"]  = concurrentKernels;
    output["async_engines_count"] = asyncEnginesCount;
    output["cooperative"]         = cooperative;
  }

  /**
   * Reads the hardware properties back from a JSON object
   *
   * @param[in] input JSON object containing every hardware field
   */
  __INLINE__ void deserialize(const nlohmann::json &input)
  {
    major             = getNumber<int>(input, "major");
    minor             = getNumber<int>(input, "minor");
    totalMemory       = getNumber<size_t>(input, "total_memory");
    smsCount          = getNumber<int>(input, "sms_count");
    smThreads         = getNumber<int>(input, "sm_threads");
    smSharedMemory    = getNumber<size_t>(input, "sm_shared_memory");
    smRegisters       = getNumber<int>(input, "sm_registers");
    smBlocks          = getNumber<int>(input, "sm_blocks");
    blockThreads      = getNumber<int>(input, "block_threads");
    blockSharedMemory = getNumber<size_t>(input, "block_shared_memory");
    blockRegisters    = getNumber<int>(input, "block_registers");
    warpSize          = getNumber<int>(input, "warp_size");
    l2CacheSize       = getNumber<int>(input, "l2_cache_size");
    concurrentKernels = getBoolean(input, "concurrent_kernels");
    asyncEnginesCount = getNumber<int>(input, "async_engines_count");
    cooperative       = getBoolean(input, "cooperative");
  }

  private:

  template <typename T>
  __INLINE__ static T getNumber(const nlohmann::json &input, const char *key)
  {
    if (input.contains(key) == false) GPUQ_THROW_LOGIC("The serialized object contains no '%s' key", key);
    if (input[key].is_number() == false) GPUQ_THROW_LOGIC("The '%s' entry is not a number", key);
    return input[key].get<T>();
  }

  __INLINE__ static bool getBoolean(const nlohmann::json &input, const char *key)
  {
    if (input.contains(key) == false) GPUQ_THROW_LOGIC("The serialized object contains no '%s' key", key);
    if (input[key].is_boolean() == false) GPUQ_THROW_LOGIC("The '%s' entry is not a boolean", key);
    return input[key].get<bool>();
  }
};

/**
 * This struct represents one physical device, as seen by a backend during one enumeration pass:
 *
 * - The ordinal is global across all providers and unique within the pass
 * - The index is the system-wide (visibility independent) index of the device, scoped by its provider
 * - Descriptors are produced fresh on every backend call and are never cached
 */
struct Descriptor
{
  /**
   * Ordinal of the device across all providers
   */
  int ord = 0;

  /**
   * The runtime providing this device (exactly one provider bit)
   */
  Provider provider = Provider::CUDA;

  /**
   * System-wide, provider-scoped index of the device
   */
  int index = 0;

  /**
   * Device name, as reported by the runtime
   */
  std::string name;

  /**
   * Pass-through hardware fields
   */
  HardwareProperties hardware;

  Descriptor() = default;

  /**
   * Full constructor
   *
   * @param[in] ord Global ordinal
   * @param[in] provider Providing runtime
   * @param[in] index System-wide provider-scoped index
   * @param[in] name Device name
   * @param[in] hardware Hardware fields
   */
  Descriptor(const int ord, const Provider provider, const int index, std::string name, const HardwareProperties &hardware)
    : ord(ord),
      provider(provider),
      index(index),
      name(std::move(name)),
      hardware(hardware)
  {}

  /**
   * Deserializing constructor
   *
   * @param[in] input A JSON-encoded serialized descriptor
   */
  Descriptor(const nlohmann::json &input) { deserialize(input); }

  bool operator==(const Descriptor &) const = default;

  /**
   * Serialization function to enable sharing device information
   *
   * @return JSON-formatted serialized descriptor
   */
  [[nodiscard]] __INLINE__ nlohmann::json serialize() const
  {
    nlohmann::json output;

    output["ord"]      = ord;
    output["provider"] = provider.getName();
    output["index"]    = index;
    output["name"]     = name;
    hardware.serialize(output);

    return output;
  }

  /**
   * De-serialization function to re-construct a descriptor from its serialized form
   *
   * @param[in] input JSON-formatted serialized descriptor
   */
  __INLINE__ void deserialize(const nlohmann::json &input)
  {
    // Sanity checks
    if (input.contains("ord") == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as it lacks the 'ord' entry");
    if (input["ord"].is_number_integer() == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as the 'ord' entry is not an integer");
    if (input.contains("provider") == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as it lacks the 'provider' entry");
    if (input["provider"].is_string() == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as the 'provider' entry is not a string");
    if (input.contains("index") == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as it lacks the 'index' entry");
    if (input["index"].is_number_integer() == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as the 'index' entry is not an integer");
    if (input.contains("name") == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as it lacks the 'name' entry");
    if (input["name"].is_string() == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as the 'name' entry is not a string");

    // A descriptor always belongs to exactly one provider
    const auto p = Provider::fromName(input["provider"].get<std::string>());
    if (p.isSingle() == false) GPUQ_THROW_LOGIC("Serialized descriptor is invalid, as '%s' is not a single provider", p.getName().c_str());

    ord      = input["ord"].get<int>();
    provider = p;
    index    = input["index"].get<int>();
    name     = input["name"].get<std::string>();
    hardware.deserialize(input);
  }
};

} // namespace gpuq
