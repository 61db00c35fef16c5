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

#ifndef SHUTTLE_ROUTING_DISTANCE_CACHE_H_
#define SHUTTLE_ROUTING_DISTANCE_CACHE_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {

// Symmetric matrix of the distances between the factory and the pickup spots,
// computed once before the search so that the search itself never queries
// the distance provider.
//
// Nodes are numbered as follows: node 0 is the factory, node i + 1 is the
// i-th pickup spot.
class DistanceCache {
 public:
  static constexpr int kFactoryNode = 0;
  static int SpotNode(int spot) { return spot + 1; }

  // Computes the factory to spot distance of every spot and the spot to spot
  // distance of every unordered pair of spots, calling `provider` exactly
  // once per pair. Both directions of a pair share the same value. Returns an
  // error if the provider fails or returns a negative or non finite distance.
  static absl::StatusOr<DistanceCache> Build(const GeoPoint& factory,
                                             absl::Span<const GeoPoint> spots,
                                             DistanceProvider* provider);
  static absl::StatusOr<DistanceCache> Build(const ShuttleRoutingModel& model,
                                             DistanceProvider* provider);

  int num_nodes() const { return num_nodes_; }
  int num_spots() const { return num_nodes_ - 1; }

  // Distance in kilometers between two nodes. Nodes outside the cache are a
  // programming error; 0 is returned for them in non-debug mode.
  double Distance(int from_node, int to_node) const;

  double FactoryToSpot(int spot) const {
    return Distance(kFactoryNode, SpotNode(spot));
  }
  double SpotToSpot(int from_spot, int to_spot) const {
    return Distance(SpotNode(from_spot), SpotNode(to_spot));
  }

  // Number of calls made to the provider while building the cache.
  int64_t num_provider_calls() const { return num_provider_calls_; }

 private:
  explicit DistanceCache(int num_nodes);

  void Set(int node1, int node2, double distance);

  int num_nodes_;
  int64_t num_provider_calls_ = 0;
  // Row-major num_nodes_ x num_nodes_ matrix.
  std::vector<double> distances_;
};

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_DISTANCE_CACHE_H_
