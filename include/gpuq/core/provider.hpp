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
 * @file provider.hpp
 * @brief Provides the provider bitmask used to select GPU runtimes
 * @date 19/10/2026
 */

#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>

namespace gpuq
{

/**
 * A set of GPU runtimes (providers), represented as a bitmask over the fixed universe {CUDA, HIP}.
 *
 * - Each provider owns one bit, bits are disjoint powers of two
 * - ANY (empty mask) means "no restriction" wherever a provider filter is accepted and is normalized to ALL before filtering
 * - Iteration over the universe always follows the order CUDA, HIP
 */
class Provider final
{
  public:

  /**
   * Underlying storage type for the provider bits
   */
  typedef uint8_t mask_t;

  /**
   * Number of providers in the universe
   */
  static constexpr size_t universeSize = 2;

  constexpr Provider()
    : _mask(0)
  {}

  /**
   * Constructs a provider set from raw bits. Bits outside of the universe are dropped.
   *
   * @param[in] mask Raw provider bits
   */
  constexpr explicit Provider(const mask_t mask)
    : _mask(mask & _allBits)
  {}

  /**
   * The CUDA runtime
   */
  static const Provider CUDA;

  /**
   * The HIP (ROCm) runtime
   */
  static const Provider HIP;

  /**
   * The empty mask, meaning no restriction
   */
  static const Provider ANY;

  /**
   * Every provider in the universe
   */
  static const Provider ALL;

  /**
   * Returns the providers of the universe, one bit each, in canonical order
   *
   * \return CUDA followed by HIP
   */
  static constexpr std::array<Provider, universeSize> universe() { return {Provider(_cudaBit), Provider(_hipBit)}; }

  /**
   * Gets the raw provider bits
   *
   * \return The raw bitmask
   */
  [[nodiscard]] constexpr mask_t getMask() const { return _mask; }

  /**
   * Indicates whether the mask is empty
   *
   * \return True, if no provider bit is set
   */
  [[nodiscard]] constexpr bool isAny() const { return _mask == 0; }

  /**
   * Indicates whether exactly one provider bit is set
   *
   * \return True, if this mask denotes a single provider
   */
  [[nodiscard]] constexpr bool isSingle() const { return _mask != 0 && (_mask & (_mask - 1)) == 0; }

  /**
   * Membership test
   *
   * @param[in] other The provider(s) to look for
   * \return True, if every bit of other is also set in this mask (an empty other is never contained)
   */
  [[nodiscard]] constexpr bool contains(const Provider other) const { return other._mask != 0 && (_mask & other._mask) == other._mask; }

  /**
   * Maps ANY to ALL, leaves any other mask unchanged
   *
   * \return The normalized mask
   */
  [[nodiscard]] constexpr Provider normalize() const { return isAny() ? Provider(_allBits) : *this; }

  constexpr Provider operator|(const Provider other) const { return Provider(static_cast<mask_t>(_mask | other._mask)); }
  constexpr Provider operator&(const Provider other) const { return Provider(static_cast<mask_t>(_mask & other._mask)); }

  /**
   * Complement restricted to the provider universe
   *
   * \return Every provider not in this mask
   */
  constexpr Provider operator~() const { return Provider(static_cast<mask_t>(~_mask & _allBits)); }

  constexpr Provider &operator|=(const Provider other)
  {
    _mask = static_cast<mask_t>(_mask | other._mask);
    return *this;
  }

  constexpr Provider &operator&=(const Provider other)
  {
    _mask = static_cast<mask_t>(_mask & other._mask);
    return *this;
  }

  constexpr bool operator==(const Provider other) const { return _mask == other._mask; }
  constexpr bool operator!=(const Provider other) const { return _mask != other._mask; }

  /**
   * Ordering on the raw bits, allowing providers to be used as ordered map keys
   */
  constexpr bool operator<(const Provider other) const { return _mask < other._mask; }

  /**
   * Gets a human-readable name for this mask
   *
   * \return "CUDA" or "HIP" for single providers, "ANY" for the empty mask, "ALL" for the full one.
   */
  [[nodiscard]] __INLINE__ std::string getName() const
  {
    if (_mask == 0) return "ANY";
    if (_mask == _allBits) return "ALL";
    return getNames();
  }

  /**
   * Gets the names of all providers contained in the mask, joined with '|', in canonical order
   *
   * \return The joined names (empty string for ANY)
   */
  [[nodiscard]] __INLINE__ std::string getNames() const
  {
    std::string names;
    for (const auto p : universe())
      if (contains(p))
      {
        if (names.empty() == false) names += "|";
        names += p == Provider(_cudaBit) ? "CUDA" : "HIP";
      }
    return names;
  }

  /**
   * Resolves a provider tag (as reported by a device backend) into a provider
   *
   * @param[in] name One of "CUDA", "HIP", "ANY", "ALL"
   * \return The matching provider mask
   */
  __INLINE__ static Provider fromName(const std::string &name)
  {
    if (name == "CUDA") return Provider(_cudaBit);
    if (name == "HIP") return Provider(_hipBit);
    if (name == "ANY") return Provider();
    if (name == "ALL") return Provider(_allBits);

    GPUQ_THROW_VALIDATION("Unknown provider name: '%s'", name.c_str());
  }

  private:

  static constexpr mask_t _cudaBit = 1 << 0;
  static constexpr mask_t _hipBit  = 1 << 1;
  static constexpr mask_t _allBits = _cudaBit | _hipBit;

  mask_t _mask;
};

inline constexpr Provider Provider::CUDA = Provider(Provider::_cudaBit);
inline constexpr Provider Provider::HIP  = Provider(Provider::_hipBit);
inline constexpr Provider Provider::ANY  = Provider();
inline constexpr Provider Provider::ALL  = Provider(Provider::_allBits);

__INLINE__ std::ostream &operator<<(std::ostream &os, const Provider &provider) { return os << provider.getName(); }

} // namespace gpuq
