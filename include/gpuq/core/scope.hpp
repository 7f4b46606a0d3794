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
 * @file scope.hpp
 * @brief Provides the per-thread, dynamically scoped selection of the active backend
 * @date 19/10/2026
 */

#pragma once

#include <gpuq/core/backend.hpp>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/backends/genuine/backend.hpp>

namespace gpuq
{

namespace detail
{

/**
 * Backend explicitly activated on the calling thread. nullptr means the process-wide default is active.
 */
inline thread_local Backend *activeBackend = nullptr;

} // namespace detail

/**
 * Gets the process-wide default backend, created on first use. This is a genuine backend reading the real system.
 *
 * @return The default backend
 */
__INLINE__ Backend *getDefaultBackend()
{
  static backend::genuine::Backend defaultBackend;
  return &defaultBackend;
}

/**
 * Gets the backend active on the calling thread
 *
 * @return The explicitly activated backend, or the default one if none was activated
 */
__INLINE__ Backend *getBackend()
{
  if (detail::activeBackend == nullptr) return getDefaultBackend();
  return detail::activeBackend;
}

/**
 * Activates a backend on the calling thread, without any automatic restoration
 *
 * @param[in] backend The backend to activate. nullptr re-activates the default backend
 * @return The backend that was active before the call
 */
__INLINE__ Backend *setBackend(Backend *backend)
{
  auto previous         = getBackend();
  detail::activeBackend = backend;

  GPUQ_LOG_DEBUG("Active backend changed from %p to %p", (void *)previous, (void *)getBackend());

  return previous;
}

inline Backend *Backend::activate() { return setBackend(this); }

/**
 * Scoped override of the active backend.
 *
 * The constructor captures the calling thread's current selection and activates the given backend; the destructor puts the captured
 * selection back, also when the scope is left by an exception. Nested guards unwind in strict LIFO order.
 *
 * Guards must be destroyed on the thread that created them.
 */
class ScopedBackend final
{
  public:

  /**
   * Constructor
   *
   * @param[in] backend The backend to activate for the lifetime of this guard. nullptr activates the default backend
   */
  ScopedBackend(Backend *backend)
    : _previous(detail::activeBackend)
  {
    detail::activeBackend = backend;
  }

  ScopedBackend(const ScopedBackend &)            = delete;
  ScopedBackend &operator=(const ScopedBackend &) = delete;
  ScopedBackend(ScopedBackend &&)                 = delete;
  ScopedBackend &operator=(ScopedBackend &&)      = delete;

  ~ScopedBackend() { detail::activeBackend = _previous; }

  /**
   * \return The backend active within this scope
   */
  [[nodiscard]] __INLINE__ Backend *get() const { return getBackend(); }

  private:

  Backend *const _previous;
};

} // namespace gpuq
