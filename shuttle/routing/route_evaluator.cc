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

#include <limits>
#include <vector>

#include "absl/types/span.h"
#include "shuttle/routing/distance_cache.h"

namespace shuttle::routing {

Tour BuildNearestNeighborTour(const DistanceCache& distances,
                              absl::Span<const int> spots) {
  Tour tour;
  if (spots.empty()) return tour;
  const int num_spots = spots.size();
  tour.spots.reserve(num_spots);
  std::vector<bool> visited(num_spots, false);
  int current_node = DistanceCache::kFactoryNode;
  for (int step = 0; step < num_spots; ++step) {
    int best = -1;
    double best_distance = std::numeric_limits<double>::infinity();
    for (int i = 0; i < num_spots; ++i) {
      if (visited[i]) continue;
      const double distance =
          distances.Distance(current_node, DistanceCache::SpotNode(spots[i]));
      if (best == -1 || distance < best_distance) {
        best = i;
        best_distance = distance;
      }
    }
    visited[best] = true;
    tour.spots.push_back(spots[best]);
    tour.distance_km += best_distance;
    current_node = DistanceCache::SpotNode(spots[best]);
  }
  tour.distance_km +=
      distances.Distance(current_node, DistanceCache::kFactoryNode);
  return tour;
}

double NearestNeighborTourDistance(const DistanceCache& distances,
                                   absl::Span<const int> spots) {
  return BuildNearestNeighborTour(distances, spots).distance_km;
}

}  // namespace shuttle::routing
