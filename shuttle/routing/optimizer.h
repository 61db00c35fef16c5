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

#ifndef SHUTTLE_ROUTING_OPTIMIZER_H_
#define SHUTTLE_ROUTING_OPTIMIZER_H_

#include "absl/status/statusor.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/result.pb.h"

namespace shuttle::routing {

// Assigns the workers of the pickup spots of `model` to its vehicles and
// sequences the stops of each vehicle, minimizing the total cost of the
// routes. The search builds a greedy solution, improves it with ruin and
// recreate iterations, then tries to consolidate it on fewer or cheaper
// vehicles.
//
// Distances are great-circle distances unless parameters.use_real_roads() is
// set and `road_provider` is not null, in which case they come from
// `road_provider`, falling back to great-circle distances for every query it
// fails to answer. `road_provider` is not owned and may be null.
//
// Returns an InvalidArgumentError if `model` or `parameters` is invalid. When
// the fleet cannot seat all the workers, the result lists the workers left at
// each spot in unassigned_spots. The result only depends on the arguments
// (including parameters.random_seed()) and on the answers of
// `road_provider`.
absl::StatusOr<OptimizationResult> Optimize(
    const ShuttleRoutingModel& model, const ShuttleSearchParameters& parameters,
    DistanceProvider* road_provider = nullptr);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_OPTIMIZER_H_
