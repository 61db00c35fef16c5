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

#include "shuttle/routing/route_evaluator.h"

#include <cmath>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/testing/test_models.h"

namespace shuttle::routing {
namespace {

using ::shuttle::routing::test::MakePoint;
using ::shuttle::routing::test::PlanarDistanceProvider;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

DistanceCache PlanarCache(const std::vector<GeoPoint>& spots) {
  PlanarDistanceProvider provider;
  absl::StatusOr<DistanceCache> cache =
      DistanceCache::Build(MakePoint(0, 0), spots, &provider);
  EXPECT_TRUE(cache.ok()) << cache.status();
  return *std::move(cache);
}

TEST(NearestNeighborTourTest, NoSpot) {
  const DistanceCache cache = PlanarCache({MakePoint(3, 0)});
  const Tour tour = BuildNearestNeighborTour(cache, {});
  EXPECT_THAT(tour.spots, IsEmpty());
  EXPECT_EQ(tour.distance_km, 0);
}

TEST(NearestNeighborTourTest, SingleSpotIsARoundTrip) {
  const DistanceCache cache = PlanarCache({MakePoint(3, 0)});
  EXPECT_DOUBLE_EQ(NearestNeighborTourDistance(cache, {0}), 6);
}

TEST(NearestNeighborTourTest, VisitsNearestFirst) {
  // Factory at the origin, spots at distances 4, 3 and 10.
  const DistanceCache cache =
      PlanarCache({MakePoint(0, 4), MakePoint(3, 0), MakePoint(10, 0)});
  const Tour tour = BuildNearestNeighborTour(cache, {0, 1, 2});
  EXPECT_THAT(tour.spots, ElementsAre(1, 0, 2));
  // 3 + 5 + sqrt(116) + 10.
  EXPECT_NEAR(tour.distance_km, 18 + std::sqrt(116.0), 1e-9);
}

TEST(NearestNeighborTourTest, TiesGoToFirstInInputOrder) {
  const DistanceCache cache = PlanarCache({MakePoint(0, 2), MakePoint(2, 0)});
  EXPECT_THAT(BuildNearestNeighborTour(cache, {0, 1}).spots,
              ElementsAre(0, 1));
  EXPECT_THAT(BuildNearestNeighborTour(cache, {1, 0}).spots,
              ElementsAre(1, 0));
}

TEST(NearestNeighborTourTest, IsDeterministic) {
  const DistanceCache cache = PlanarCache(
      {MakePoint(1, 5), MakePoint(4, 2), MakePoint(-3, 3), MakePoint(2, -6)});
  const Tour first = BuildNearestNeighborTour(cache, {0, 1, 2, 3});
  const Tour second = BuildNearestNeighborTour(cache, {0, 1, 2, 3});
  EXPECT_EQ(first.spots, second.spots);
  EXPECT_EQ(first.distance_km, second.distance_km);
}

}  // namespace
}  // namespace shuttle::routing
