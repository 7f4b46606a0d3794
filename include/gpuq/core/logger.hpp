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
 * @file logger.hpp
 * @brief Provides warning and debug logging to stderr
 * @date 19/10/2026
 */

#pragma once

#include <gpuq/core/definitions.hpp>
#include <stdarg.h>
#include <stdexcept>
#include <stdio.h>
#include <stdlib.h>
#include <string>

namespace gpuq
{

// Warning logging function
#define GPUQ_LOG_WARNING(...) gpuq::logWarning(__FILE__, __LINE__, __VA_ARGS__)
__USED__ inline void logWarning(const char *fileName, const int lineNumber, const char *format, ...)
{
  char   *outstr = nullptr;
  va_list ap;
  va_start(ap, format);
  auto res = vasprintf(&outstr, format, ap);
  va_end(ap);
  if (res < 0) throw std::runtime_error("Error in logWarning\n");

  std::string outString = std::string("[gpuq] [Warning] ") + std::string(outstr);
  free(outstr);

  char info[1024];

  snprintf(info, sizeof(info) - 1, " + From %s:%d\n", fileName, lineNumber);
  outString += info;

  fprintf(stderr, "%s", outString.c_str());
}

// Debug logging function, only compiled in on request
#ifdef GPUQ_ENABLE_DEBUG_LOGGING
  #define GPUQ_LOG_DEBUG(...) gpuq::logDebug(__FILE__, __LINE__, __VA_ARGS__)
#else
  #define GPUQ_LOG_DEBUG(...) \
    do {                      \
    } while (0)
#endif
__USED__ inline void logDebug(const char *fileName, const int lineNumber, const char *format, ...)
{
  char   *outstr = nullptr;
  va_list ap;
  va_start(ap, format);
  auto res = vasprintf(&outstr, format, ap);
  va_end(ap);
  if (res < 0) throw std::runtime_error("Error in logDebug\n");

  std::string outString = std::string("[gpuq] [Debug] ") + std::string(outstr);
  free(outstr);

  fprintf(stderr, "%s (%s:%d)\n", outString.c_str(), fileName, lineNumber);
}

} // namespace gpuq
