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
 * @file properties.cpp
 * @brief Unit tests for the query result class
 * @date 19/10/2026
 */

#include <sstream>
#include "gtest/gtest.h"
#include <gpuq/core/properties.hpp>
#include <gpuq/backends/mock/backend.hpp>
#include "mocks.hpp"

TEST(Properties, Accessors)
{
  gpuq::backend::mock::Backend backend;
  auto                         descriptor = makeDescriptor(2, gpuq::Provider::HIP, 1, "Test GPU");

  gpuq::Properties properties(descriptor, 0, &backend);
  EXPECT_EQ(properties.getOrd(), 2);
  EXPECT_EQ(properties.getProvider(), gpuq::Provider::HIP);
  EXPECT_EQ(properties.getIndex(), 0);
  EXPECT_EQ(properties.getSystemIndex(), 1);
  EXPECT_TRUE(properties.isVisible());
  EXPECT_EQ(properties.getBackend(), &backend);
  EXPECT_EQ(properties.getName(), "Test GPU");
  EXPECT_EQ(properties.getMajor(), 8);
  EXPECT_EQ(properties.getMinor(), 6);
  EXPECT_EQ(properties.getTotalMemory(), 1024);
  EXPECT_EQ(properties.getWarpSize(), 32);
  EXPECT_EQ(properties.getDescriptor(), descriptor);

  // Hidden devices have no local index
  gpuq::Properties hidden(descriptor, std::nullopt, &backend);
  EXPECT_FALSE(hidden.isVisible());
  EXPECT_FALSE(hidden.getIndex().has_value());
}

TEST(Properties, Serialize)
{
  gpuq::Properties visible(makeDescriptor(1, gpuq::Provider::CUDA, 1), 0, nullptr);
  auto             serialized = visible.serialize();
  EXPECT_EQ(serialized["ord"], 1);
  EXPECT_EQ(serialized["index"], 0);
  EXPECT_EQ(serialized["system_index"], 1);
  EXPECT_EQ(serialized["provider"], "CUDA");

  gpuq::Properties hidden(makeDescriptor(1, gpuq::Provider::CUDA, 1), std::nullopt, nullptr);
  EXPECT_TRUE(hidden.serialize()["index"].is_null());

  // Stripping leaves every index out
  auto stripped = visible.serialize(true);
  EXPECT_FALSE(stripped.contains("ord"));
  EXPECT_FALSE(stripped.contains("index"));
  EXPECT_FALSE(stripped.contains("system_index"));
  EXPECT_TRUE(stripped.contains("name"));
  EXPECT_TRUE(stripped.contains("cooperative"));
}

TEST(Properties, Equality)
{
  gpuq::backend::mock::Backend backend;

  // Same backend, same local index
  gpuq::Properties a(makeDescriptor(0, gpuq::Provider::CUDA, 0), 0, &backend);
  gpuq::Properties b(makeDescriptor(0, gpuq::Provider::CUDA, 0), 0, &backend);
  EXPECT_EQ(a, b);

  // Identical hardware under different indices is still equivalent
  gpuq::Properties c(makeDescriptor(1, gpuq::Provider::CUDA, 1), std::nullopt, nullptr);
  EXPECT_EQ(a, c);

  // Different hardware is not
  gpuq::Properties d(makeDescriptor(1, gpuq::Provider::CUDA, 1, "Other GPU"), 1, &backend);
  EXPECT_NE(a, d);

  gpuq::Properties e(makeDescriptor(0, gpuq::Provider::HIP, 0), 1, &backend);
  EXPECT_NE(a, e);
}

TEST(Properties, Presentation)
{
  gpuq::Properties visible(makeDescriptor(1, gpuq::Provider::CUDA, 1, "Test GPU"), 0, nullptr);
  EXPECT_EQ(visible.getIdentifier(), "gpuq::Properties(CUDA[1 -> 0], 'Test GPU')");

  gpuq::Properties hidden(makeDescriptor(0, gpuq::Provider::HIP, 2, "Test GPU"), std::nullopt, nullptr);
  EXPECT_EQ(hidden.getIdentifier(), "gpuq::Properties(HIP[2 -> None], 'Test GPU')");

  // Fields follow the identifier, in declaration order
  auto text = visible.toString();
  EXPECT_EQ(text.rfind(visible.getIdentifier() + "{\n", 0), 0);
  EXPECT_NE(text.find("    major: 8\n"), std::string::npos);
  EXPECT_LT(text.find("    major: 8\n"), text.find("    cooperative: false\n"));
  EXPECT_EQ(text.back(), '}');

  std::stringstream stream;
  stream << visible;
  EXPECT_EQ(stream.str(), text);
}
