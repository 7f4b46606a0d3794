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
 * @file definitions.hpp
 * @brief Provides common definitions and annotations used across gpuq
 * @date 19/10/2026
 */

#pragma once

namespace gpuq
{

// API annotation for inline functions, to make sure they are considered during coverage analysis
// This solution was taken from https://stackoverflow.com/a/10824832
#if defined __GNUC__ && defined GPUQ_ENABLE_COVERAGE
  #define __INLINE__ __attribute__((__used__)) inline
#else
  #define __INLINE__ inline
#endif

// Annotation for free functions and constructors that must survive dead code elimination
#if defined __GNUC__
  #define __USED__ __attribute__((__used__))
#else
  #define __USED__
#endif

} // namespace gpuq
