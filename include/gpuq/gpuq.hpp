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
 * @file gpuq.hpp
 * @brief Includes the whole gpuq public interface: the query engine, the backend scope and both backends
 * @date 19/10/2026
 */

#pragma once

#include <gpuq/core/definitions.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/core/provider.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/visibility.hpp>
#include <gpuq/core/backend.hpp>
#include <gpuq/core/properties.hpp>
#include <gpuq/core/scope.hpp>
#include <gpuq/core/query.hpp>
#include <gpuq/backends/genuine/backend.hpp>
#include <gpuq/backends/mock/backend.hpp>
