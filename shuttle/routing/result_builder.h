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

#ifndef SHUTTLE_ROUTING_RESULT_BUILDER_H_
#define SHUTTLE_ROUTING_RESULT_BUILDER_H_

#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/result.pb.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

// Color of the route_index-th route of a result, cycling through a palette of
// 10 colors.
absl::string_view GetRouteColor(int route_index);

// Geometry of a route visiting `points` in order. When `road_provider` is not
// null it is asked for the whole polyline, which gives a single segment with
// turn-by-turn steps. Otherwise, or if it fails, the route is made of one
// straight segment per pair of consecutive points, traveled at
// `fallback_speed_kmh`.
std::vector<RouteSegment> BuildRouteSegments(absl::Span<const GeoPoint> points,
                                             DistanceProvider* road_provider,
                                             double fallback_speed_kmh);

// Converts `solution`, which must be evaluated, to the result of the
// optimization. Routes are listed in vehicle order, one per used vehicle,
// with one stop per distinct spot in the order of their first assignment.
// Spots which did not get all their workers assigned are reported as
// unassigned. `road_provider` may be null and is used as in
// BuildRouteSegments() when parameters.use_real_roads() is true.
OptimizationResult BuildOptimizationResult(
    const Problem& problem, const Solution& solution,
    const ShuttleSearchParameters& parameters, DistanceProvider* road_provider);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_RESULT_BUILDER_H_
