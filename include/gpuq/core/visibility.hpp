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
 * @file visibility.hpp
 * @brief Provides the visibility resolver: allow-list parsing, index translation and the visibility scope
 * @date 19/10/2026
 */

#pragma once

#include <algorithm>
#include <charconv>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/provider.hpp>

namespace gpuq
{

/**
 * Ordered list of visible system indices for one provider. std::nullopt means unrestricted.
 */
typedef std::optional<std::vector<int>> visibleList_t;

/**
 * Per-provider allow-list snapshot
 */
typedef std::map<Provider, visibleList_t> Visibility;

/**
 * Sorts and de-duplicates a list of system indices
 *
 * @param[in] indices The indices to normalize
 * @return The sorted list without repetitions
 */
__INLINE__ std::vector<int> normalizeVisibleList(std::vector<int> indices)
{
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  return indices;
}

/**
 * Parses a comma-separated list of device indices
 *
 * Every token must be a non-negative integer (surrounding blanks are tolerated). No partial parse is accepted.
 *
 * @param[in] variable Name of the variable the text was read from, used for error reporting
 * @param[in] text The raw value of the variable
 * @return The parsed indices, sorted ascending and without repetitions
 */
__INLINE__ std::vector<int> parseIndexList(const std::string &variable, const std::string &text)
{
  std::vector<int> indices;

  size_t begin = 0;
  while (true)
  {
    // Getting next token
    const auto end   = text.find(',', begin);
    const auto token = text.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

    // Trimming blanks around the token
    const auto first = token.find_first_not_of(" \t");
    const auto last  = token.find_last_not_of(" \t");
    const auto value = first == std::string::npos ? std::string() : token.substr(first, last - first + 1);

    // Parsing the token as a whole
    int  index  = -1;
    auto result = std::from_chars(value.data(), value.data() + value.size(), index);
    if (value.empty() || result.ec != std::errc() || result.ptr != value.data() + value.size() || index < 0)
      GPUQ_THROW_VALIDATION("%s environment variable contains values that are not non-negative integers - this is currently not supported: '%s'",
                            variable.c_str(),
                            token.c_str());

    indices.push_back(index);

    if (end == std::string::npos) break;
    begin = end + 1;
  }

  return normalizeVisibleList(std::move(indices));
}

/**
 * Parses the value of a provider allow-list variable (e.g., CUDA_VISIBLE_DEVICES)
 *
 * @param[in] provider The provider whose variable is being parsed, used for error reporting
 * @param[in] text The raw value of the variable
 * @return The parsed indices, sorted ascending and without repetitions
 */
__INLINE__ std::vector<int> parseVisibleList(const Provider provider, const std::string &text) { return parseIndexList(provider.getName() + "_VISIBLE_DEVICES", text); }

/**
 * Resolves the raw CUDA and HIP allow-list values into a visibility map.
 *
 * An absent value means unrestricted. If the CUDA value is present and the HIP one is not, HIP inherits the CUDA list,
 * following the behavior of the HIP runtime. The opposite direction does not apply.
 *
 * @param[in] cuda Raw CUDA_VISIBLE_DEVICES value, if set
 * @param[in] hip Raw HIP_VISIBLE_DEVICES value, if set
 * @return The resolved visibility map, with one entry per provider
 */
__INLINE__ Visibility resolveVisibility(const std::optional<std::string> &cuda, const std::optional<std::string> &hip)
{
  visibleList_t parsedCuda;
  if (cuda.has_value()) parsedCuda = parseVisibleList(Provider::CUDA, *cuda);

  visibleList_t parsedHip = parsedCuda;
  if (hip.has_value()) parsedHip = parseVisibleList(Provider::HIP, *hip);

  return Visibility{{Provider::CUDA, parsedCuda}, {Provider::HIP, parsedHip}};
}

/**
 * Gets the allow-list of a provider from a visibility map
 *
 * @param[in] visibility The visibility map
 * @param[in] provider The provider to look for
 * @return The provider's list, or unrestricted if the map has no entry for it
 */
__INLINE__ visibleList_t getVisibleList(const Visibility &visibility, const Provider provider)
{
  auto it = visibility.find(provider);
  if (it == visibility.end()) return std::nullopt;
  return it->second;
}

/**
 * Translates a system-wide index into the index seen by the current process
 *
 * @param[in] systemIndex System-wide, provider-scoped index of a device
 * @param[in] visibleList The allow-list of the device's provider
 * @return systemIndex if unrestricted, otherwise the position of systemIndex within the list, or std::nullopt if it is not visible
 */
__INLINE__ std::optional<int> globalToLocal(const int systemIndex, const visibleList_t &visibleList)
{
  if (visibleList.has_value() == false) return systemIndex;

  auto it = std::find(visibleList->begin(), visibleList->end(), systemIndex);
  if (it == visibleList->end()) return std::nullopt;
  return static_cast<int>(std::distance(visibleList->begin(), it));
}

/**
 * Scoped visibility acquisition, as returned by a backend's saveVisible().
 *
 * Holds the visibility map that was active when the scope was opened. The backend-provided restore action runs exactly once,
 * when the scope is destroyed, regardless of whether the scope is left normally or by an exception.
 *
 * The restore action must not throw.
 */
class VisibilityScope final
{
  public:

  /**
   * Type of the action that puts the backend's visibility state back in place
   */
  typedef std::function<void()> restoreFc_t;

  /**
   * Constructor
   *
   * @param[in] visibility The visibility map captured when opening the scope
   * @param[in] restore The action to run when the scope closes (may be empty if nothing was changed)
   */
  VisibilityScope(Visibility visibility, restoreFc_t restore)
    : _visibility(std::move(visibility)),
      _restore(std::move(restore))
  {}

  VisibilityScope(const VisibilityScope &)            = delete;
  VisibilityScope &operator=(const VisibilityScope &) = delete;

  VisibilityScope(VisibilityScope &&other) noexcept
    : _visibility(std::move(other._visibility)),
      _restore(std::exchange(other._restore, nullptr))
  {}

  VisibilityScope &operator=(VisibilityScope &&) = delete;

  ~VisibilityScope()
  {
    if (_restore) _restore();
  }

  /**
   * Gets the captured visibility map
   *
   * \return The visibility map
   */
  [[nodiscard]] __INLINE__ const Visibility &getVisibility() const { return _visibility; }

  /**
   * Gets the captured allow-list of a given provider
   *
   * @param[in] provider The provider to look for
   * \return The provider's allow-list
   */
  [[nodiscard]] __INLINE__ visibleList_t getVisibleList(const Provider provider) const { return gpuq::getVisibleList(_visibility, provider); }

  private:

  Visibility _visibility;

  restoreFc_t _restore;
};

} // namespace gpuq
