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

#include <cstdio>
#include <cstring>
#include <memory>
#include <gpuq/gpuq.hpp>

int main(int argc, char **argv)
{
  // Using the mock backend on request, configured from the GPUQ_MOCK_* environment variables
  std::unique_ptr<gpuq::backend::mock::Backend> mock;
  if (argc > 1 && strcmp(argv[1], "--mock") == 0) mock = std::make_unique<gpuq::backend::mock::Backend>(gpuq::backend::mock::Configuration::fromEnvironment());

  // Activating the selected backend for the rest of the program
  gpuq::ScopedBackend backend(mock.get());

  // Reporting which runtimes are installed
  for (const auto p : gpuq::Provider::universe()) printf("Has provider %s: %s\n", p.getName().c_str(), gpuq::hasProvider(p) ? "true" : "false");
  printf("\n");

  // Querying every device, then only the ones visible by this process
  const auto all     = gpuq::query(gpuq::Provider::ANY, gpuq::Requirement::none(), false);
  const auto visible = gpuq::query();

  printf("All devices:\n");
  printf("=====================\n");
  for (const auto &gpu : all) printf("%s\n", gpu.toString().c_str());

  printf("\n");
  printf("Visible devices:\n");
  printf("=====================\n");
  for (const auto &gpu : visible) printf("%s\n", gpu.toString().c_str());

  return 0;
}
