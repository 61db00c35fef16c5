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

#ifndef SHUTTLE_ROUTING_ROUTE_EVALUATOR_H_
#define SHUTTLE_ROUTING_ROUTE_EVALUATOR_H_

#include <vector>

#include "absl/types/span.h"
#include "shuttle/routing/distance_cache.h"

namespace shuttle::routing {

// Closed tour starting and ending at the factory.
struct Tour {
  // Spots in visiting order.
  std::vector<int> spots;
  double distance_km = 0.0;
};

// Builds the nearest neighbor tour through `spots`, which must be distinct
// spot indices: from the factory, repeatedly moves to the closest spot not
// visited yet, then returns to the factory. Ties are broken in favor of the
// spot coming first in `spots`. The tour of no spot is empty and has length 0.
Tour BuildNearestNeighborTour(const DistanceCache& distances,
                              absl::Span<const int> spots);

// Same as BuildNearestNeighborTour(distances, spots).distance_km.
double NearestNeighborTourDistance(const DistanceCache& distances,
                                   absl::Span<const int> spots);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_ROUTE_EVALUATOR_H_
