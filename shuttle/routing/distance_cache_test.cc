// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "shuttle/routing/distance_cache.h"

#include <limits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/testing/test_models.h"

namespace shuttle::routing {
namespace {

using ::shuttle::routing::test::AddPickupSpot;
using ::shuttle::routing::test::MakeModel;
using ::shuttle::routing::test::MakePoint;
using ::shuttle::routing::test::MockDistanceProvider;
using ::shuttle::routing::test::PlanarDistanceProvider;
using ::testing::_;
using ::testing::Return;

TEST(DistanceCacheTest, SymmetricWithZeroDiagonal) {
  ShuttleRoutingModel model = MakeModel();
  AddPickupSpot("a", 3, 0, 1, &model);
  AddPickupSpot("b", 0, 4, 1, &model);
  AddPickupSpot("c", 3, 4, 1, &model);
  PlanarDistanceProvider provider;
  const absl::StatusOr<DistanceCache> cache =
      DistanceCache::Build(model, &provider);
  ASSERT_TRUE(cache.ok()) << cache.status();
  EXPECT_EQ(cache->num_nodes(), 4);
  EXPECT_EQ(cache->num_spots(), 3);
  EXPECT_DOUBLE_EQ(cache->FactoryToSpot(0), 3);
  EXPECT_DOUBLE_EQ(cache->FactoryToSpot(1), 4);
  EXPECT_DOUBLE_EQ(cache->FactoryToSpot(2), 5);
  EXPECT_DOUBLE_EQ(cache->SpotToSpot(0, 1), 5);
  EXPECT_DOUBLE_EQ(cache->SpotToSpot(0, 2), 4);
  EXPECT_DOUBLE_EQ(cache->SpotToSpot(1, 2), 3);
  for (int i = 0; i < cache->num_nodes(); ++i) {
    EXPECT_EQ(cache->Distance(i, i), 0);
    for (int j = 0; j < cache->num_nodes(); ++j) {
      EXPECT_EQ(cache->Distance(i, j), cache->Distance(j, i));
    }
  }
}

TEST(DistanceCacheTest, OneProviderCallPerPair) {
  ShuttleRoutingModel model = MakeModel();
  for (int i = 0; i < 6; ++i) {
    AddPickupSpot(absl::StrCat("spot", i), i, i + 1, 1, &model);
  }
  PlanarDistanceProvider provider;
  const absl::StatusOr<DistanceCache> cache =
      DistanceCache::Build(model, &provider);
  ASSERT_TRUE(cache.ok()) << cache.status();
  // 6 factory to spot distances and 15 pairs of spots.
  EXPECT_EQ(provider.num_distance_calls(), 21);
  EXPECT_EQ(cache->num_provider_calls(), 21);
}

TEST(DistanceCacheTest, NoSpots) {
  PlanarDistanceProvider provider;
  const absl::StatusOr<DistanceCache> cache =
      DistanceCache::Build(MakeModel(), &provider);
  ASSERT_TRUE(cache.ok()) << cache.status();
  EXPECT_EQ(cache->num_nodes(), 1);
  EXPECT_EQ(provider.num_distance_calls(), 0);
}

TEST(DistanceCacheTest, ProviderErrorIsPropagated) {
  MockDistanceProvider provider;
  EXPECT_CALL(provider, Distance(_, _))
      .WillOnce(Return(absl::DeadlineExceededError("timeout")));
  const std::vector<GeoPoint> spots = {MakePoint(1, 1)};
  EXPECT_EQ(DistanceCache::Build(MakePoint(0, 0), spots, &provider)
                .status()
                .code(),
            absl::StatusCode::kDeadlineExceeded);
}

TEST(DistanceCacheTest, NonFiniteDistanceIsAnError) {
  MockDistanceProvider provider;
  EXPECT_CALL(provider, Distance(_, _))
      .WillOnce(Return(std::numeric_limits<double>::infinity()));
  const std::vector<GeoPoint> spots = {MakePoint(1, 1)};
  EXPECT_EQ(DistanceCache::Build(MakePoint(0, 0), spots, &provider)
                .status()
                .code(),
            absl::StatusCode::kInternal);
}

}  // namespace
}  // namespace shuttle::routing
