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

#include "shuttle/routing/consolidation.h"

#include <vector>

#include "absl/log/log.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/ruin_recreate.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

Solution ConsolidateRoutes(const Problem& problem, const Solution& solution) {
  const std::vector<int> demands = ComputeSpotLoads(problem, solution);
  std::vector<int> loads(problem.num_vehicles(), 0);
  Solution consolidated;
  for (int spot = 0; spot < problem.num_spots(); ++spot) {
    const int missing =
        InsertWorkers(problem, spot, demands[spot], &loads, &consolidated);
    if (missing > 0) {
      LOG(WARNING) << "Consolidation could not place " << missing
                   << " workers of spot " << problem.spot(spot).id()
                   << ", keeping the current solution";
      return solution;
    }
  }
  if (!IsValidSolution(problem, consolidated)) {
    LOG(WARNING) << "Consolidated solution is not valid, keeping the current "
                    "solution";
    return solution;
  }
  const std::vector<int> vehicle_loads =
      ComputeVehicleLoads(problem, consolidated);
  for (int v = 0; v < problem.num_vehicles(); ++v) {
    if (vehicle_loads[v] > problem.vehicle(v).capacity()) {
      LOG(WARNING) << "Consolidation overloads vehicle "
                   << problem.vehicle(v).id() << ": " << vehicle_loads[v]
                   << " > " << problem.vehicle(v).capacity();
      return solution;
    }
  }

  EvaluateSolution(problem, &consolidated);
  if (consolidated.total_cost() < solution.total_cost() ||
      consolidated.vehicles_used() < solution.vehicles_used()) {
    VLOG(1) << "Consolidated " << solution.vehicles_used() << " -> "
            << consolidated.vehicles_used() << " vehicles, cost "
            << solution.total_cost() << " -> " << consolidated.total_cost();
    return consolidated;
  }
  return solution;
}

}  // namespace shuttle::routing
