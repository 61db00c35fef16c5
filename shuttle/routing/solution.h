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

#ifndef SHUTTLE_ROUTING_SOLUTION_H_
#define SHUTTLE_ROUTING_SOLUTION_H_

#include <string>
#include <utility>
#include <vector>

#include "shuttle/routing/problem.h"

namespace shuttle::routing {

// `workers` workers of pickup spot `spot` ride in vehicle `vehicle`. Both are
// indices in the model.
struct Assignment {
  int spot = -1;
  int vehicle = -1;
  int workers = 0;

  bool operator==(const Assignment& other) const {
    return spot == other.spot && vehicle == other.vehicle &&
           workers == other.workers;
  }
};

// Metrics of a solution, as computed by EvaluateSolution().
struct SolutionMetrics {
  double fitness = 0.0;
  double total_cost = 0.0;
  double total_distance = 0.0;
  int vehicles_used = 0;
};

// An ordered list of assignments. Several assignments may share the same
// (spot, vehicle) pair, in which case their workers add up. The metrics are
// only meaningful after a call to EvaluateSolution().
class Solution {
 public:
  Solution() = default;
  explicit Solution(std::vector<Assignment> assignments)
      : assignments_(std::move(assignments)) {}

  const std::vector<Assignment>& assignments() const { return assignments_; }
  int num_assignments() const { return assignments_.size(); }

  void AddAssignment(int spot, int vehicle, int workers) {
    assignments_.push_back({spot, vehicle, workers});
  }
  // Removes all the assignments of the spots for which `removed[spot]` is
  // true.
  void RemoveSpots(const std::vector<bool>& removed);

  const SolutionMetrics& metrics() const { return metrics_; }
  void set_metrics(const SolutionMetrics& metrics) { metrics_ = metrics; }
  double fitness() const { return metrics_.fitness; }
  double total_cost() const { return metrics_.total_cost; }
  double total_distance() const { return metrics_.total_distance; }
  int vehicles_used() const { return metrics_.vehicles_used; }

  std::string DebugString() const;

 private:
  std::vector<Assignment> assignments_;
  SolutionMetrics metrics_;
};

// Number of workers carried by each vehicle.
std::vector<int> ComputeVehicleLoads(const Problem& problem,
                                     const Solution& solution);

// Number of workers assigned for each pickup spot.
std::vector<int> ComputeSpotLoads(const Problem& problem,
                                  const Solution& solution);

// For each vehicle, the distinct spots it serves, in the order of their first
// assignment.
std::vector<std::vector<int>> ComputeVehicleSpots(const Problem& problem,
                                                  const Solution& solution);

// Recomputes the metrics of `solution`: each used vehicle drives the nearest
// neighbor tour of its spots and pays its cost per km for it, and the fitness
// adds the vehicle usage penalty of the problem per used vehicle. The
// assignments are left untouched.
void EvaluateSolution(const Problem& problem, Solution* solution);

// Returns true if no vehicle carries more than its capacity and every spot
// has exactly its worker count assigned.
bool IsValidSolution(const Problem& problem, const Solution& solution);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_SOLUTION_H_
