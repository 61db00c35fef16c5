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

#include "shuttle/routing/solution.h"

#include <string>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/route_evaluator.h"

namespace shuttle::routing {

void Solution::RemoveSpots(const std::vector<bool>& removed) {
  int kept = 0;
  for (const Assignment& assignment : assignments_) {
    DCHECK_LT(assignment.spot, static_cast<int>(removed.size()));
    if (removed[assignment.spot]) continue;
    assignments_[kept++] = assignment;
  }
  assignments_.resize(kept);
}

std::string Solution::DebugString() const {
  return absl::StrCat(
      "fitness: ", metrics_.fitness, " cost: ", metrics_.total_cost,
      " distance: ", metrics_.total_distance,
      " vehicles: ", metrics_.vehicles_used, " assignments: [",
      absl::StrJoin(assignments_, ", ",
                    [](std::string* out, const Assignment& assignment) {
                      absl::StrAppend(out, assignment.spot, "->",
                                      assignment.vehicle, ":",
                                      assignment.workers);
                    }),
      "]");
}

std::vector<int> ComputeVehicleLoads(const Problem& problem,
                                     const Solution& solution) {
  std::vector<int> loads(problem.num_vehicles(), 0);
  for (const Assignment& assignment : solution.assignments()) {
    DCHECK_GE(assignment.vehicle, 0);
    DCHECK_LT(assignment.vehicle, problem.num_vehicles());
    loads[assignment.vehicle] += assignment.workers;
  }
  return loads;
}

std::vector<int> ComputeSpotLoads(const Problem& problem,
                                  const Solution& solution) {
  std::vector<int> loads(problem.num_spots(), 0);
  for (const Assignment& assignment : solution.assignments()) {
    DCHECK_GE(assignment.spot, 0);
    DCHECK_LT(assignment.spot, problem.num_spots());
    loads[assignment.spot] += assignment.workers;
  }
  return loads;
}

std::vector<std::vector<int>> ComputeVehicleSpots(const Problem& problem,
                                                  const Solution& solution) {
  std::vector<std::vector<int>> vehicle_spots(problem.num_vehicles());
  for (const Assignment& assignment : solution.assignments()) {
    std::vector<int>& spots = vehicle_spots[assignment.vehicle];
    bool seen = false;
    for (const int spot : spots) {
      if (spot == assignment.spot) {
        seen = true;
        break;
      }
    }
    if (!seen) spots.push_back(assignment.spot);
  }
  return vehicle_spots;
}

void EvaluateSolution(const Problem& problem, Solution* solution) {
  DCHECK(solution != nullptr);
  SolutionMetrics metrics;
  const std::vector<std::vector<int>> vehicle_spots =
      ComputeVehicleSpots(problem, *solution);
  for (int v = 0; v < problem.num_vehicles(); ++v) {
    if (vehicle_spots[v].empty()) continue;
    const double distance =
        NearestNeighborTourDistance(problem.distances(), vehicle_spots[v]);
    metrics.total_distance += distance;
    metrics.total_cost += distance * problem.vehicle(v).cost_per_km();
    ++metrics.vehicles_used;
  }
  metrics.fitness = metrics.total_cost +
                    metrics.vehicles_used * problem.vehicle_usage_penalty();
  solution->set_metrics(metrics);
}

bool IsValidSolution(const Problem& problem, const Solution& solution) {
  const std::vector<int> vehicle_loads = ComputeVehicleLoads(problem, solution);
  for (int v = 0; v < problem.num_vehicles(); ++v) {
    if (vehicle_loads[v] > problem.vehicle(v).capacity()) {
      VLOG(2) << "Vehicle " << problem.vehicle(v).id() << " carries "
              << vehicle_loads[v] << " workers, capacity "
              << problem.vehicle(v).capacity();
      return false;
    }
  }
  const std::vector<int> spot_loads = ComputeSpotLoads(problem, solution);
  for (int s = 0; s < problem.num_spots(); ++s) {
    if (spot_loads[s] != problem.spot(s).worker_count()) {
      VLOG(2) << "Spot " << problem.spot(s).id() << " has " << spot_loads[s]
              << " workers assigned out of " << problem.spot(s).worker_count();
      return false;
    }
  }
  return true;
}

}  // namespace shuttle::routing
