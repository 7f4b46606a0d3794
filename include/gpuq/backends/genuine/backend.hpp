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
 * @brief Implements the genuine backend, which reports the GPUs actually installed on the system
 * @date 19/10/2026
 */

#pragma once

#include <memory>
#include <utility>
#include <gpuq/core/backend.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/core/visibility.hpp>
#include <gpuq/backends/genuine/dlRuntime.hpp>
#include <gpuq/backends/genuine/environmentPort.hpp>
#include <gpuq/backends/genuine/nativeRuntime.hpp>
#include <gpuq/backends/genuine/visibilityPort.hpp>

namespace gpuq::backend::genuine
{

/**
 * Backend reporting real hardware. Device enumeration is delegated to a native runtime; the visibility state lives in
 * the *_VISIBLE_DEVICES variables, accessed through a visibility port.
 */
class Backend final : public gpuq::Backend
{
  public:

  /**
   * Builds a backend over the dynamically loaded GPU runtimes and the process environment
   */
  Backend()
    : Backend(std::make_shared<DlRuntime>(), std::make_shared<EnvironmentPort>())
  {}

  /**
   * Constructor
   *
   * @param[in] runtime The native routine used to detect runtimes and enumerate devices
   * @param[in] port The access point to the raw visibility values
   */
  Backend(std::shared_ptr<NativeRuntime> runtime, std::shared_ptr<VisibilityPort> port)
    : gpuq::Backend(),
      _runtime(std::move(runtime)),
      _port(std::move(port))
  {
    if (_runtime == nullptr) GPUQ_THROW_LOGIC("The genuine backend requires a native runtime");
    if (_port == nullptr) GPUQ_THROW_LOGIC("The genuine backend requires a visibility port");
  }

  ~Backend() = default;

  [[nodiscard]] __INLINE__ const std::shared_ptr<NativeRuntime> &getRuntime() const { return _runtime; }
  [[nodiscard]] __INLINE__ const std::shared_ptr<VisibilityPort> &getPort() const { return _port; }

  protected:

  __INLINE__ bool providerCheckImpl(const Provider provider) override { return _runtime->checkProvider(provider); }

  __INLINE__ VisibilityScope saveVisibleImpl(const bool clear) override
  {
    auto snapshot = _port->read();

    // Parsing before clearing, so that an invalid value leaves the environment untouched
    auto visibility = resolveVisibility(snapshot[Provider::CUDA], snapshot[Provider::HIP]);

    if (clear == false) return VisibilityScope(std::move(visibility), nullptr);

    GPUQ_LOG_DEBUG("Clearing visibility variables");
    _port->clear();

    auto port = _port;
    return VisibilityScope(std::move(visibility), [port, snapshot = std::move(snapshot)]() { port->restore(snapshot); });
  }

  __INLINE__ int countImpl() override { return _runtime->count(); }

  __INLINE__ Descriptor getImpl(const int ordinal) override { return _runtime->get(ordinal); }

  private:

  const std::shared_ptr<NativeRuntime> _runtime;

  const std::shared_ptr<VisibilityPort> _port;
};

} // namespace gpuq::backend::genuine

#include <gpuq/core/scope.hpp>
