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

#include <cmath>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "shuttle/base/status_macros.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {
namespace {

// Queries `provider` and checks that the answer can be used as a distance.
absl::StatusOr<double> QueryDistance(DistanceProvider* provider,
                                     const GeoPoint& from, const GeoPoint& to) {
  ASSIGN_OR_RETURN(const double distance, provider->Distance(from, to));
  if (!std::isfinite(distance) || distance < 0) {
    return absl::InternalError(absl::StrCat(
        "Invalid distance ", distance, " between (", from.latitude(), ", ",
        from.longitude(), ") and (", to.latitude(), ", ", to.longitude(), ")"));
  }
  return distance;
}

}  // namespace

DistanceCache::DistanceCache(int num_nodes)
    : num_nodes_(num_nodes), distances_(num_nodes * num_nodes, 0.0) {}

absl::StatusOr<DistanceCache> DistanceCache::Build(
    const GeoPoint& factory, absl::Span<const GeoPoint> spots,
    DistanceProvider* provider) {
  CHECK(provider != nullptr);
  const int num_spots = spots.size();
  DistanceCache cache(num_spots + 1);

  for (int spot = 0; spot < num_spots; ++spot) {
    ASSIGN_OR_RETURN(const double distance,
                     QueryDistance(provider, factory, spots[spot]));
    ++cache.num_provider_calls_;
    cache.Set(kFactoryNode, SpotNode(spot), distance);
  }
  for (int i = 0; i < num_spots; ++i) {
    for (int j = i + 1; j < num_spots; ++j) {
      ASSIGN_OR_RETURN(const double distance,
                       QueryDistance(provider, spots[i], spots[j]));
      ++cache.num_provider_calls_;
      cache.Set(SpotNode(i), SpotNode(j), distance);
    }
  }
  VLOG(1) << "Distance cache built with " << cache.num_provider_calls_
          << " provider calls for " << num_spots << " spots";
  return cache;
}

absl::StatusOr<DistanceCache> DistanceCache::Build(
    const ShuttleRoutingModel& model, DistanceProvider* provider) {
  std::vector<GeoPoint> spots;
  spots.reserve(model.pickup_spots_size());
  for (const PickupSpot& spot : model.pickup_spots()) {
    spots.push_back(spot.location());
  }
  return Build(model.factory().location(), spots, provider);
}

double DistanceCache::Distance(int from_node, int to_node) const {
  DCHECK_GE(from_node, 0);
  DCHECK_LT(from_node, num_nodes_);
  DCHECK_GE(to_node, 0);
  DCHECK_LT(to_node, num_nodes_);
  if (from_node < 0 || from_node >= num_nodes_ || to_node < 0 ||
      to_node >= num_nodes_) {
    return 0.0;
  }
  return distances_[from_node * num_nodes_ + to_node];
}

void DistanceCache::Set(int node1, int node2, double distance) {
  distances_[node1 * num_nodes_ + node2] = distance;
  distances_[node2 * num_nodes_ + node1] = distance;
}

}  // namespace shuttle::routing
