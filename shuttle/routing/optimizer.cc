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

#include "shuttle/routing/optimizer.h"

#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "shuttle/base/status_macros.h"
#include "shuttle/routing/consolidation.h"
#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/greedy_construction.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/model_validation.h"
#include "shuttle/routing/parameters.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/result.pb.h"
#include "shuttle/routing/result_builder.h"
#include "shuttle/routing/ruin_recreate.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

absl::StatusOr<OptimizationResult> Optimize(
    const ShuttleRoutingModel& model, const ShuttleSearchParameters& parameters,
    DistanceProvider* road_provider) {
  RETURN_IF_ERROR(ValidateShuttleSearchParameters(parameters));
  RETURN_IF_ERROR(ValidateShuttleRoutingModel(model));
  const bool log_search = parameters.log_search();

  StraightLineDistanceProvider straight_line(parameters.fallback_speed_kmh());
  std::unique_ptr<FallbackDistanceProvider> road_with_fallback;
  DistanceProvider* distance_provider = &straight_line;
  if (parameters.use_real_roads() && road_provider != nullptr) {
    road_with_fallback = std::make_unique<FallbackDistanceProvider>(
        road_provider, parameters.fallback_speed_kmh());
    distance_provider = road_with_fallback.get();
  }
  ASSIGN_OR_RETURN(DistanceCache distances,
                   DistanceCache::Build(model, distance_provider));
  if (road_with_fallback != nullptr &&
      road_with_fallback->num_fallbacks() > 0) {
    LOG(WARNING) << road_with_fallback->num_fallbacks() << " of "
                 << distances.num_provider_calls()
                 << " distances are straight-line estimates";
  }

  const Problem problem(&model, std::move(distances),
                        parameters.vehicle_usage_penalty());
  if (log_search) {
    LOG(INFO) << "Optimizing " << problem.num_spots() << " pickup spots ("
              << problem.total_demand() << " workers) with "
              << problem.num_vehicles() << " vehicles ("
              << problem.total_capacity() << " seats)";
  }

  Solution best = BuildGreedySolution(problem);
  if (log_search) LOG(INFO) << "Greedy solution: " << best.DebugString();

  RuinAndRecreateSearch search(&problem, parameters);
  best = search.Run(best);

  if (parameters.consolidate()) {
    best = ConsolidateRoutes(problem, best);
  }
  if (log_search) LOG(INFO) << "Final solution: " << best.DebugString();

  return BuildOptimizationResult(problem, best, parameters, road_provider);
}

}  // namespace shuttle::routing
