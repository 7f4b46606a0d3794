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
 * @file exceptions.hpp
 * @brief Provides a failure model and corresponding exception classes.
 * @date 19/10/2026
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdarg.h>
#include <stdexcept>
#include <string>
#include <gpuq/core/definitions.hpp>

namespace gpuq
{

namespace exceptions
{

/**
 * Enumeration of different exception types in gpuq for internal use
 */
enum exception_t
{
  /**
   * Represents a logic exception
   */
  logic,

  /**
   * Represents a runtime exception
   */
  runtime,

  /**
   * Represents a fatal exception
   */
  fatal,

  /**
   * An index or ordinal outside of the valid range
   */
  outOfRange,

  /**
   * Malformed user or environment input
   */
  validation,

  /**
   * The runtime of a required provider is not installed
   */
  providerUnavailable,

  /**
   * No devices were detected at all
   */
  noDevices,

  /**
   * Some required providers were not observed during enumeration
   */
  missingProviders,

  /**
   * A non-empty result was requested but nothing matched
   */
  noSuitableDevices
};

} // namespace exceptions

/**
 * Macro for throwing a logic exception in gpuq. It includes additional information in the message, such as line number and source file.
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_LOGIC(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::logic, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing a runtime exception in gpuq. It automatically includes additional information in the message, such as line number and source file.
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_RUNTIME(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::runtime, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing a fatal exception in gpuq. It automatically includes additional information in the message, such as line number and source file.
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_FATAL(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::fatal, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing an out-of-range exception (bad device ordinal or result index)
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_OUT_OF_RANGE(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::outOfRange, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing a validation exception (malformed input)
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_VALIDATION(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::validation, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing when a required provider runtime is not installed
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_PROVIDER_UNAVAILABLE(...) \
  [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::providerUnavailable, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing when no devices could be detected while some were required
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_NO_DEVICES(...) [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::noDevices, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing when a non-empty result was requested but no device matched
 *
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_NO_SUITABLE_DEVICES(...) \
  [[unlikely]] gpuq::throwException(gpuq::exceptions::exception_t::noSuitableDevices, __FILE__, __LINE__, __VA_ARGS__)

/**
 * Macro for throwing when some required providers were never observed. The first argument is the raw mask of missing providers.
 *
 * \param[in] mask Raw provider bits still outstanding
 * \param[in] ... C-Formatted string and its additional arguments
 */
#define GPUQ_THROW_MISSING_PROVIDERS(mask, ...) [[unlikely]] gpuq::throwMissingProviders(mask, __FILE__, __LINE__, __VA_ARGS__)

/**
 * A class of exceptions that indicate some error in the arguments to a gpuq
 * call.
 *
 * When an exception of this (super)type is thrown, it shall be as though the
 * call to the gpuq function that threw it, had never been made.
 */
class LogicException : public std::logic_error
{
  public:

  /**
   * Constructor for a logic exception
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ LogicException(const char *const message)
    : logic_error(message)
  {}
};

/**
 * A class of exceptions that indicate a non-fatal runtime error has been
 * encountered during a call to a gpuq function.
 *
 * When an exception of this (super)type is thrown, it shall be as though the
 * call to the gpuq function that threw it, had never been made.
 */
class RuntimeException : public std::runtime_error
{
  public:

  /**
   * Constructor for a runtime exception
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ RuntimeException(const char *const message)
    : runtime_error(message)
  {}
};

/**
 * A class of exceptions that are fatal in that gpuq enters some
 * undefined state. When this class of exceptions are caught, users can only
 * attempt to wind down the application as gracefully as possible.
 */
class FatalException : public std::runtime_error
{
  public:

  /**
   * Constructor for a fatal exception
   *
   * @param[in] message  Explanation message for this exception
   */
  __USED__ FatalException(const char *const message)
    : runtime_error(message)
  {}
};

/**
 * Thrown when a device ordinal or a result index falls outside of its valid range
 */
class OutOfRangeException : public LogicException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ OutOfRangeException(const char *const message)
    : LogicException(message)
  {}
};

/**
 * Thrown when user or environment provided input cannot be accepted (e.g., a malformed *_VISIBLE_DEVICES value)
 */
class ValidationException : public LogicException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ ValidationException(const char *const message)
    : LogicException(message)
  {}
};

/**
 * Thrown when the runtime of a required provider is not installed
 */
class ProviderUnavailableException : public RuntimeException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ ProviderUnavailableException(const char *const message)
    : RuntimeException(message)
  {}
};

/**
 * Thrown when no devices were detected on the system while something was required
 */
class NoDevicesException : public RuntimeException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ NoDevicesException(const char *const message)
    : RuntimeException(message)
  {}
};

/**
 * Thrown when a non-empty result was requested and no device satisfied the filters
 */
class NoSuitableDevicesException : public RuntimeException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   */
  __USED__ NoSuitableDevicesException(const char *const message)
    : RuntimeException(message)
  {}
};

/**
 * Thrown when some of the required providers have not been observed during enumeration.
 *
 * The exception keeps the raw bits of every provider that remained outstanding.
 */
class MissingProvidersException : public RuntimeException
{
  public:

  /**
   * Constructor
   *
   * @param[in] message Explanation message for this exception
   * @param[in] missingMask Raw bits of the providers that were never observed
   */
  __USED__ MissingProvidersException(const char *const message, const uint8_t missingMask)
    : RuntimeException(message),
      _missingMask(missingMask)
  {}

  /**
   * Returns the raw bits of the missing providers
   *
   * \return The missing provider mask
   */
  [[nodiscard]] __INLINE__ uint8_t getMissingMask() const { return _missingMask; }

  private:

  const uint8_t _missingMask;
};

/**
 * This function creates the exception message for a gpuq exception (for internal use)
 *
 * @param[in] type Invoked exception type
 * @param[in] fileName The source file where this exception has been thrown
 * @param[in] lineNumber Line number inside the source file where this exception has been thrown
 * @param[in] format C-Formatted message provided by the user explaining the reason of the exception
 * @param[in] ap Arguments, if any, to the C-Formatted message
 * @return The complete exception message
 */
__INLINE__ std::string formatExceptionMessage(const exceptions::exception_t type, const char *fileName, const int lineNumber, const char *format, va_list ap)
{
  char *outstr = nullptr;
  auto  res    = vasprintf(&outstr, format, ap);
  if (res < 0) throw std::runtime_error("Error in exceptions.hpp, formatExceptionMessage() function\n");

  std::string typeString = "Undefined";
  switch (type)
  {
  case exceptions::exception_t::logic: typeString = "Logic"; break;
  case exceptions::exception_t::runtime: typeString = "Runtime"; break;
  case exceptions::exception_t::fatal: typeString = "Fatal"; break;
  case exceptions::exception_t::outOfRange: typeString = "Out Of Range"; break;
  case exceptions::exception_t::validation: typeString = "Validation"; break;
  case exceptions::exception_t::providerUnavailable: typeString = "Provider Unavailable"; break;
  case exceptions::exception_t::noDevices: typeString = "No Devices"; break;
  case exceptions::exception_t::missingProviders: typeString = "Missing Providers"; break;
  case exceptions::exception_t::noSuitableDevices: typeString = "No Suitable Devices"; break;
  default: break;
  }
  std::string outString = std::string("[gpuq] ") + typeString + std::string(" Exception: ") + std::string(outstr);
  free(outstr);

  char info[1024];
  snprintf(info, sizeof(info) - 1, " + From %s:%d\n", fileName, lineNumber);
  outString += info;

  return outString;
}

/**
 * This function throws a gpuq exception of the given type (for internal use)
 *
 * @param[in] type Invoked exception type
 * @param[in] fileName The source file where this exception has been thrown
 * @param[in] lineNumber Line number inside the source file where this exception has been thrown
 * @param[in] format C-Formatted message provided by the user explaining the reason of the exception
 * @param[in] ... Arguments, if any, to the C-Formatted message
 */
__USED__ inline void throwException [[noreturn]] (const exceptions::exception_t type, const char *fileName, const int lineNumber, const char *format, ...)
{
  va_list ap;
  va_start(ap, format);
  const auto outString = formatExceptionMessage(type, fileName, lineNumber, format, ap);
  va_end(ap);

  switch (type)
  {
  case exceptions::exception_t::logic: throw LogicException(outString.c_str());
  case exceptions::exception_t::runtime: throw RuntimeException(outString.c_str());
  case exceptions::exception_t::fatal: throw FatalException(outString.c_str());
  case exceptions::exception_t::outOfRange: throw OutOfRangeException(outString.c_str());
  case exceptions::exception_t::validation: throw ValidationException(outString.c_str());
  case exceptions::exception_t::providerUnavailable: throw ProviderUnavailableException(outString.c_str());
  case exceptions::exception_t::noDevices: throw NoDevicesException(outString.c_str());
  case exceptions::exception_t::missingProviders: throw MissingProvidersException(outString.c_str(), 0);
  case exceptions::exception_t::noSuitableDevices: throw NoSuitableDevicesException(outString.c_str());
  default: break;
  }

  throw std::runtime_error(outString.c_str());
}

/**
 * This function throws a missing providers exception carrying the outstanding provider mask (for internal use)
 *
 * @param[in] missingMask Raw bits of the providers that were never observed
 * @param[in] fileName The source file where this exception has been thrown
 * @param[in] lineNumber Line number inside the source file where this exception has been thrown
 * @param[in] format C-Formatted message provided by the user explaining the reason of the exception
 * @param[in] ... Arguments, if any, to the C-Formatted message
 */
__USED__ inline void throwMissingProviders [[noreturn]] (const uint8_t missingMask, const char *fileName, const int lineNumber, const char *format, ...)
{
  va_list ap;
  va_start(ap, format);
  const auto outString = formatExceptionMessage(exceptions::exception_t::missingProviders, fileName, lineNumber, format, ap);
  va_end(ap);

  throw MissingProvidersException(outString.c_str(), missingMask);
}

} // namespace gpuq
