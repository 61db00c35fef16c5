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

#include "shuttle/routing/greedy_construction.h"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

#include "absl/log/log.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {
namespace {

// Workers of a spot still waiting for a vehicle.
struct PendingSpot {
  int spot;
  int workers;
};

}  // namespace

Solution BuildGreedySolution(const Problem& problem) {
  std::vector<int> spots(problem.num_spots());
  std::iota(spots.begin(), spots.end(), 0);
  std::stable_sort(spots.begin(), spots.end(), [&problem](int a, int b) {
    return problem.spot(a).worker_count() > problem.spot(b).worker_count();
  });
  std::vector<PendingSpot> pending;
  pending.reserve(spots.size());
  for (const int spot : spots) {
    pending.push_back({spot, problem.spot(spot).worker_count()});
  }

  Solution solution;
  std::vector<PendingSpot> next_pending;
  for (const int v : problem.vehicles_by_cost()) {
    if (pending.empty()) break;
    const int capacity = problem.vehicle(v).capacity();
    int load = 0;
    next_pending.clear();
    for (const PendingSpot& entry : pending) {
      if (entry.workers <= capacity - load) {
        solution.AddAssignment(entry.spot, v, entry.workers);
        load += entry.workers;
      } else if (load < capacity) {
        const int available = capacity - load;
        solution.AddAssignment(entry.spot, v, available);
        load = capacity;
        next_pending.push_back({entry.spot, entry.workers - available});
      } else {
        next_pending.push_back(entry);
      }
    }
    pending.swap(next_pending);
  }

  int64_t assigned = 0;
  for (const Assignment& assignment : solution.assignments()) {
    assigned += assignment.workers;
  }
  if (assigned < problem.total_demand()) {
    LOG(WARNING) << "Only " << assigned << "/" << problem.total_demand()
                 << " workers could be assigned, the fleet has "
                 << problem.total_capacity() << " seats";
  }
  EvaluateSolution(problem, &solution);
  return solution;
}

}  // namespace shuttle::routing
