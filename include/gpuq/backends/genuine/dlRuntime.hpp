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
 * @file dlRuntime.hpp
 * @brief Implements the native runtime by dynamically loading the CUDA driver and the HIP runtime
 * @date 19/10/2026
 */

#pragma once

#include <dlfcn.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gpuq/core/definitions.hpp>
#include <gpuq/core/descriptor.hpp>
#include <gpuq/core/exceptions.hpp>
#include <gpuq/core/logger.hpp>
#include <gpuq/backends/genuine/nativeRuntime.hpp>

namespace gpuq::backend::genuine
{

/**
 * Native runtime that loads the GPU runtimes at call time with dlopen, so that gpuq has no link-time dependency on any of them.
 *
 * - CUDA devices are read through the CUDA driver API (libcuda)
 * - HIP devices are read through the HIP runtime (libamdhip64)
 * - CUDA devices take the lowest ordinals, followed by HIP devices
 *
 * Libraries are opened and closed on every call, at most once per runtime and call. Each library is first looked up in every location hint (a directory), in order,
 * and then by its bare name, following the system search rules.
 *
 * \note Both runtimes read their *_VISIBLE_DEVICES variable when they are first initialized in the process.
 */
class DlRuntime final : public NativeRuntime
{
  public:

  /**
   * hipDeviceGetAttribute identifiers of the hardware fields, which depend on the ROCm release
   */
  struct HipAttributes
  {
    int multiprocessorCount;
    int maxThreadsPerMultiprocessor;
    int maxSharedMemoryPerMultiprocessor;
    int maxRegistersPerMultiprocessor;
    int maxBlocksPerMultiprocessor;
    int maxThreadsPerBlock;
    int maxSharedMemoryPerBlock;
    int maxRegistersPerBlock;
    int warpSize;
    int l2CacheSize;
    int concurrentKernels;
    int asyncEngineCount;
    int cooperativeLaunch;
  };

  /**
   * Maximum number of location hints
   */
  static constexpr size_t maxLocationHints = 16;

  /**
   * Maximum length of a single location hint
   */
  static constexpr size_t maxLocationHintLength = 127;

  DlRuntime()
    : _locationHints(getDefaultLocationHints())
  {}

  ~DlRuntime() = default;

  /**
   * Gets the location hints used when none are set explicitly
   *
   * @return The default location hints
   */
  __INLINE__ static std::vector<std::string> getDefaultLocationHints() { return {"/usr/local/cuda/lib64", "/opt/rocm/lib"}; }

  /**
   * Replaces the directories searched for the runtime libraries
   *
   * @param[in] hints Up to maxLocationHints non-empty directories, of at most maxLocationHintLength characters each
   */
  __INLINE__ void setLocationHints(const std::vector<std::string> &hints)
  {
    if (hints.size() > maxLocationHints) GPUQ_THROW_VALIDATION("Too many location hints: %lu (maximum: %lu)", hints.size(), maxLocationHints);

    for (const auto &hint : hints)
    {
      if (hint.empty()) GPUQ_THROW_VALIDATION("Location hints cannot be empty");
      if (hint.size() > maxLocationHintLength) GPUQ_THROW_VALIDATION("Location hint is too long: %lu characters (maximum: %lu)", hint.size(), maxLocationHintLength);
    }

    _locationHints = hints;
  }

  /**
   * Puts the default location hints back in place
   */
  __INLINE__ void restoreDefaultHints() { _locationHints = getDefaultLocationHints(); }

  [[nodiscard]] __INLINE__ const std::vector<std::string> &getLocationHints() const { return _locationHints; }

  /**
   * Gets the diagnostics gathered while loading the runtimes during the last call, one ' * ' prefixed line per failure
   *
   * @return The diagnostics, empty if nothing failed
   */
  [[nodiscard]] __INLINE__ const std::string &getLastError() const { return _lastError; }

  __INLINE__ bool checkProvider(const Provider provider) override
  {
    _lastError.clear();

    if (provider == Provider::CUDA) return loadCuda().has_value();
    if (provider == Provider::HIP) return loadHip().has_value();

    GPUQ_THROW_LOGIC("Provider checks require exactly one provider, '%s' was passed", provider.getName().c_str());
  }

  __INLINE__ int count() override
  {
    _lastError.clear();

    const auto cuda = loadCuda();
    const auto hip  = loadHip();
    return countCuda(cuda) + countHip(hip);
  }

  __INLINE__ Descriptor get(const int ordinal) override
  {
    _lastError.clear();

    if (ordinal < 0) GPUQ_THROW_OUT_OF_RANGE("Invalid device index: %d", ordinal);

    // CUDA devices come first, read through the same handle that counted them
    const auto cuda      = loadCuda();
    const auto cudaCount = countCuda(cuda);
    if (ordinal < cudaCount) return getCuda(*cuda, ordinal, ordinal);

    const auto hip      = loadHip();
    const auto hipCount = countHip(hip);
    if (ordinal < cudaCount + hipCount) return getHip(*hip, ordinal, ordinal - cudaCount);

    GPUQ_THROW_OUT_OF_RANGE("Invalid device index: %d (%d devices detected)", ordinal, cudaCount + hipCount);
  }

  /**
   * Gets the number of runtime libraries successfully opened by this object so far
   *
   * @return The number of dlopen calls that returned a handle
   */
  [[nodiscard]] __INLINE__ size_t getOpenedLibraries() const { return _openedLibraries; }

  /**
   * Gets the hipDeviceGetAttribute identifiers matching a HIP runtime version
   *
   * ROCm 5 renumbered hipDeviceAttribute_t after the CUDA attribute list. ROCm 6 only renamed or appended entries, so both
   * releases share the identifiers below.
   *
   * @param[in] version The version reported by hipRuntimeGetVersion (major * 10000000 + minor * 100000 + patch)
   * @return The identifiers, or nothing for releases older than ROCm 5
   */
  [[nodiscard]] __INLINE__ static std::optional<HipAttributes> getHipAttributes(const int version)
  {
    if (version / 10000000 < 5) return std::nullopt;

    HipAttributes attributes;
    attributes.multiprocessorCount              = 63;
    attributes.maxThreadsPerMultiprocessor      = 57;
    attributes.maxSharedMemoryPerMultiprocessor = 76;
    attributes.maxRegistersPerMultiprocessor    = 72;
    attributes.maxBlocksPerMultiprocessor       = 25;
    attributes.maxThreadsPerBlock               = 56;
    attributes.maxSharedMemoryPerBlock          = 74;
    attributes.maxRegistersPerBlock             = 71;
    attributes.warpSize                         = 87;
    attributes.l2CacheSize                      = 19;
    attributes.concurrentKernels                = 8;
    attributes.asyncEngineCount                 = 2;
    attributes.cooperativeLaunch                = 10;
    return attributes;
  }

  private:

  /**
   * Error code returned by both runtimes when they work but find no device
   */
  static constexpr int _noDeviceError = 100;

  /**
   * Owner of a dlopen handle
   */
  class Library final
  {
    public:

    Library(void *handle)
      : _handle(handle)
    {}

    Library(const Library &)            = delete;
    Library &operator=(const Library &) = delete;

    ~Library() { dlclose(_handle); }

    template <typename T>
    __INLINE__ T getSymbol(const char *name) const
    {
      return reinterpret_cast<T>(dlsym(_handle, name));
    }

    private:

    void *const _handle;
  };

  // CUDA driver API entry points (CUresult and CUdevice are plain ints)
  struct CudaApi
  {
    std::unique_ptr<Library> library;
    int (*cuInit)(unsigned int);
    int (*cuDeviceGetCount)(int *);
    int (*cuDeviceGet)(int *, int);
    int (*cuDeviceGetName)(char *, int, int);
    int (*cuDeviceTotalMem)(size_t *, int);
    int (*cuDeviceGetAttribute)(int *, int, int);

    // False when the driver works but has no device
    bool hasDevices;
  };

  // HIP runtime entry points (hipError_t and hipDevice_t are plain ints)
  struct HipApi
  {
    std::unique_ptr<Library> library;
    int (*hipGetDeviceCount)(int *);
    int (*hipDeviceGet)(int *, int);
    int (*hipDeviceGetName)(char *, int, int);
    int (*hipDeviceTotalMem)(size_t *, int);
    int (*hipDeviceComputeCapability)(int *, int *, int);
    int (*hipDeviceGetAttribute)(int *, int, int);
    int (*hipRuntimeGetVersion)(int *);
  };

  // CUdevice_attribute values
  enum cudaAttribute_t : int
  {
    maxThreadsPerBlock               = 1,
    maxSharedMemoryPerBlock          = 8,
    warpSize                         = 10,
    maxRegistersPerBlock             = 12,
    multiprocessorCount              = 16,
    concurrentKernels                = 31,
    l2CacheSize                      = 38,
    maxThreadsPerMultiprocessor      = 39,
    asyncEngineCount                 = 40,
    computeCapabilityMajor           = 75,
    computeCapabilityMinor           = 76,
    maxSharedMemoryPerMultiprocessor = 81,
    maxRegistersPerMultiprocessor    = 82,
    cooperativeLaunch                = 95,
    maxBlocksPerMultiprocessor       = 106
  };

  __INLINE__ void recordError(const std::string &message)
  {
    GPUQ_LOG_DEBUG("Native runtime: %s", message.c_str());

    if (_lastError.empty() == false) _lastError += "\n";
    _lastError += " * " + message;
  }

  __INLINE__ void recordDlError()
  {
    const auto err = dlerror();
    if (err != nullptr) recordError(err);
  }

  __INLINE__ std::unique_ptr<Library> openLibrary(const std::vector<std::string> &names)
  {
    for (const auto &name : names)
    {
      // Trying every location hint first
      for (const auto &hint : _locationHints)
      {
        auto handle = dlopen((hint + "/" + name).c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle != nullptr) return adopt(handle);
        recordDlError();
      }

      // Then relying on the system search path
      auto handle = dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
      if (handle != nullptr) return adopt(handle);
      recordDlError();
    }

    return nullptr;
  }

  __INLINE__ std::unique_ptr<Library> adopt(void *handle)
  {
    _openedLibraries++;
    return std::make_unique<Library>(handle);
  }

  template <typename T>
  __INLINE__ bool resolve(const Library &library, const char *name, T &function)
  {
    function = library.getSymbol<T>(name);
    if (function == nullptr) recordError(std::string("Missing symbol: ") + name);
    return function != nullptr;
  }

  __INLINE__ std::optional<CudaApi> loadCuda()
  {
    auto library = openLibrary({"libcuda.so.1", "libcuda.so"});
    if (library == nullptr) return std::nullopt;

    CudaApi api;
    auto    ok = resolve(*library, "cuInit", api.cuInit);
    ok         = resolve(*library, "cuDeviceGetCount", api.cuDeviceGetCount) && ok;
    ok         = resolve(*library, "cuDeviceGet", api.cuDeviceGet) && ok;
    ok         = resolve(*library, "cuDeviceGetName", api.cuDeviceGetName) && ok;
    ok         = resolve(*library, "cuDeviceTotalMem_v2", api.cuDeviceTotalMem) && ok;
    ok         = resolve(*library, "cuDeviceGetAttribute", api.cuDeviceGetAttribute) && ok;
    if (ok == false) return std::nullopt;

    const auto status = api.cuInit(0);
    if (status != 0 && status != _noDeviceError)
    {
      recordError("cuInit failed with error " + std::to_string(status));
      return std::nullopt;
    }

    api.hasDevices = status == 0;
    api.library    = std::move(library);
    return api;
  }

  __INLINE__ std::optional<HipApi> loadHip()
  {
    auto library = openLibrary({"libamdhip64.so", "libamdhip64.so.6", "libamdhip64.so.5"});
    if (library == nullptr) return std::nullopt;

    HipApi api;
    auto   ok = resolve(*library, "hipGetDeviceCount", api.hipGetDeviceCount);
    ok        = resolve(*library, "hipDeviceGet", api.hipDeviceGet) && ok;
    ok        = resolve(*library, "hipDeviceGetName", api.hipDeviceGetName) && ok;
    ok        = resolve(*library, "hipDeviceTotalMem", api.hipDeviceTotalMem) && ok;
    ok        = resolve(*library, "hipDeviceComputeCapability", api.hipDeviceComputeCapability) && ok;
    ok        = resolve(*library, "hipDeviceGetAttribute", api.hipDeviceGetAttribute) && ok;
    ok        = resolve(*library, "hipRuntimeGetVersion", api.hipRuntimeGetVersion) && ok;
    if (ok == false) return std::nullopt;

    // Initialization happens implicitly on the first call
    int  count  = 0;
    auto status = api.hipGetDeviceCount(&count);
    if (status != 0 && status != _noDeviceError)
    {
      recordError("hipGetDeviceCount failed with error " + std::to_string(status));
      return std::nullopt;
    }

    api.library = std::move(library);
    return api;
  }

  __INLINE__ int countCuda(const std::optional<CudaApi> &api)
  {
    if (api.has_value() == false || api->hasDevices == false) return 0;

    int  count  = 0;
    auto status = api->cuDeviceGetCount(&count);
    if (status != 0) GPUQ_THROW_RUNTIME("cuDeviceGetCount failed with error %d", status);

    return count;
  }

  __INLINE__ int countHip(const std::optional<HipApi> &api)
  {
    if (api.has_value() == false) return 0;

    int  count  = 0;
    auto status = api->hipGetDeviceCount(&count);
    if (status == _noDeviceError) return 0;
    if (status != 0) GPUQ_THROW_RUNTIME("hipGetDeviceCount failed with error %d", status);

    return count;
  }

  __INLINE__ Descriptor getCuda(const CudaApi &api, const int ordinal, const int index)
  {
    int device = 0;
    if (auto status = api.cuDeviceGet(&device, index); status != 0) GPUQ_THROW_RUNTIME("cuDeviceGet(%d) failed with error %d", index, status);

    char name[256] = {0};
    if (auto status = api.cuDeviceGetName(name, sizeof(name) - 1, device); status != 0)
      GPUQ_THROW_RUNTIME("cuDeviceGetName(%d) failed with error %d", index, status);

    HardwareProperties hardware;
    if (auto status = api.cuDeviceTotalMem(&hardware.totalMemory, device); status != 0)
      GPUQ_THROW_RUNTIME("cuDeviceTotalMem(%d) failed with error %d", index, status);

    auto attribute = [&](const cudaAttribute_t id) {
      int value = 0;
      if (auto status = api.cuDeviceGetAttribute(&value, id, device); status != 0)
        GPUQ_THROW_RUNTIME("cuDeviceGetAttribute(%d, %d) failed with error %d", static_cast<int>(id), index, status);
      return value;
    };

    hardware.major             = attribute(computeCapabilityMajor);
    hardware.minor             = attribute(computeCapabilityMinor);
    hardware.smsCount          = attribute(multiprocessorCount);
    hardware.smThreads         = attribute(maxThreadsPerMultiprocessor);
    hardware.smSharedMemory    = static_cast<size_t>(attribute(maxSharedMemoryPerMultiprocessor));
    hardware.smRegisters       = attribute(maxRegistersPerMultiprocessor);
    hardware.smBlocks          = attribute(maxBlocksPerMultiprocessor);
    hardware.blockThreads      = attribute(maxThreadsPerBlock);
    hardware.blockSharedMemory = static_cast<size_t>(attribute(maxSharedMemoryPerBlock));
    hardware.blockRegisters    = attribute(maxRegistersPerBlock);
    hardware.warpSize          = attribute(warpSize);
    hardware.l2CacheSize       = attribute(l2CacheSize);
    hardware.concurrentKernels = attribute(concurrentKernels) != 0;
    hardware.asyncEnginesCount = attribute(asyncEngineCount);
    hardware.cooperative       = attribute(cooperativeLaunch) != 0;

    return Descriptor(ordinal, Provider::CUDA, index, name, hardware);
  }

  __INLINE__ Descriptor getHip(const HipApi &api, const int ordinal, const int index)
  {
    int device = 0;
    if (auto status = api.hipDeviceGet(&device, index); status != 0) GPUQ_THROW_RUNTIME("hipDeviceGet(%d) failed with error %d", index, status);

    char name[256] = {0};
    if (auto status = api.hipDeviceGetName(name, sizeof(name) - 1, device); status != 0)
      GPUQ_THROW_RUNTIME("hipDeviceGetName(%d) failed with error %d", index, status);

    HardwareProperties hardware;
    if (auto status = api.hipDeviceTotalMem(&hardware.totalMemory, device); status != 0)
      GPUQ_THROW_RUNTIME("hipDeviceTotalMem(%d) failed with error %d", index, status);
    if (auto status = api.hipDeviceComputeCapability(&hardware.major, &hardware.minor, device); status != 0)
      GPUQ_THROW_RUNTIME("hipDeviceComputeCapability(%d) failed with error %d", index, status);

    int version = 0;
    if (auto status = api.hipRuntimeGetVersion(&version); status != 0) GPUQ_THROW_RUNTIME("hipRuntimeGetVersion failed with error %d", status);

    const auto ids = getHipAttributes(version);
    if (ids.has_value() == false)
    {
      GPUQ_LOG_WARNING("HIP runtime version %d predates ROCm 5, only the name, memory and capability of device %d are read", version, index);
      return Descriptor(ordinal, Provider::HIP, index, name, hardware);
    }

    // Attributes a release does not implement are reported as 0
    auto attribute = [&](const int id) {
      int value = 0;
      if (auto status = api.hipDeviceGetAttribute(&value, id, device); status != 0)
      {
        GPUQ_LOG_WARNING("hipDeviceGetAttribute(%d, %d) failed with error %d", id, index, status);
        return 0;
      }
      return value;
    };

    hardware.smsCount          = attribute(ids->multiprocessorCount);
    hardware.smThreads         = attribute(ids->maxThreadsPerMultiprocessor);
    hardware.smSharedMemory    = static_cast<size_t>(attribute(ids->maxSharedMemoryPerMultiprocessor));
    hardware.smRegisters       = attribute(ids->maxRegistersPerMultiprocessor);
    hardware.smBlocks          = attribute(ids->maxBlocksPerMultiprocessor);
    hardware.blockThreads      = attribute(ids->maxThreadsPerBlock);
    hardware.blockSharedMemory = static_cast<size_t>(attribute(ids->maxSharedMemoryPerBlock));
    hardware.blockRegisters    = attribute(ids->maxRegistersPerBlock);
    hardware.warpSize          = attribute(ids->warpSize);
    hardware.l2CacheSize       = attribute(ids->l2CacheSize);
    hardware.concurrentKernels = attribute(ids->concurrentKernels) != 0;
    hardware.asyncEnginesCount = attribute(ids->asyncEngineCount);
    hardware.cooperative       = attribute(ids->cooperativeLaunch) != 0;

    return Descriptor(ordinal, Provider::HIP, index, name, hardware);
  }

  std::vector<std::string> _locationHints;

  std::string _lastError;

  size_t _openedLibraries = 0;
};

} // namespace gpuq::backend::genuine
