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

#include "shuttle/routing/ruin_recreate.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/parameters.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

RandomRemovalRuinProcedure::RandomRemovalRuinProcedure(const Problem* problem,
                                                       std::mt19937* rnd)
    : problem_(*problem), rnd_(*rnd) {}

std::vector<int> RandomRemovalRuinProcedure::Ruin(const Solution& /*solution*/,
                                                  int num_spots) {
  const int size = problem_.num_spots();
  num_spots = std::min(num_spots, size);
  std::vector<int> spots(size);
  std::iota(spots.begin(), spots.end(), 0);
  // Partial Fisher-Yates shuffle: the first num_spots entries are a uniform
  // sample without replacement.
  for (int i = 0; i < num_spots; ++i) {
    std::uniform_int_distribution<int> dist(i, size - 1);
    std::swap(spots[i], spots[dist(rnd_)]);
  }
  spots.resize(num_spots);
  return spots;
}

WorstRemovalRuinProcedure::WorstRemovalRuinProcedure(const Problem* problem)
    : problem_(*problem) {}

std::vector<int> WorstRemovalRuinProcedure::Ruin(const Solution& solution,
                                                 int num_spots) {
  // Number of distinct vehicles serving each spot.
  std::vector<int> num_vehicles(problem_.num_spots(), 0);
  std::vector<bool> seen(problem_.num_spots() * problem_.num_vehicles(), false);
  for (const Assignment& assignment : solution.assignments()) {
    const int key =
        assignment.spot * problem_.num_vehicles() + assignment.vehicle;
    if (seen[key]) continue;
    seen[key] = true;
    ++num_vehicles[assignment.spot];
  }

  std::vector<std::pair<double, int>> costs;
  for (int spot = 0; spot < problem_.num_spots(); ++spot) {
    if (num_vehicles[spot] == 0) continue;
    costs.push_back({2 * problem_.distances().FactoryToSpot(spot) *
                         problem_.average_cost_per_km() * num_vehicles[spot],
                     spot});
  }
  std::stable_sort(costs.begin(), costs.end(),
                   [](const std::pair<double, int>& a,
                      const std::pair<double, int>& b) {
                     return a.first > b.first;
                   });

  std::vector<int> spots;
  for (int i = 0; i < std::min<int>(num_spots, costs.size()); ++i) {
    spots.push_back(costs[i].second);
  }
  return spots;
}

RelatedRemovalRuinProcedure::RelatedRemovalRuinProcedure(const Problem* problem,
                                                         std::mt19937* rnd)
    : problem_(*problem), rnd_(*rnd) {}

std::vector<int> RelatedRemovalRuinProcedure::Ruin(const Solution& /*solution*/,
                                                   int num_spots) {
  const int size = problem_.num_spots();
  std::vector<int> spots;
  if (size == 0 || num_spots <= 0) return spots;
  num_spots = std::min(num_spots, size);

  std::vector<bool> removed(size, false);
  std::uniform_int_distribution<int> dist(0, size - 1);
  const int seed_spot = dist(rnd_);
  removed[seed_spot] = true;
  spots.push_back(seed_spot);

  // Sum of the distances from each spot to the removed spots.
  std::vector<double> distance_to_removed(size, 0.0);
  const DistanceCache& distances = problem_.distances();
  while (static_cast<int>(spots.size()) < num_spots) {
    const int last = spots.back();
    int nearest = -1;
    double nearest_distance = std::numeric_limits<double>::infinity();
    for (int spot = 0; spot < size; ++spot) {
      if (removed[spot]) continue;
      distance_to_removed[spot] += distances.SpotToSpot(last, spot);
      if (nearest == -1 || distance_to_removed[spot] < nearest_distance) {
        nearest = spot;
        nearest_distance = distance_to_removed[spot];
      }
    }
    DCHECK_NE(nearest, -1);
    removed[nearest] = true;
    spots.push_back(nearest);
  }
  return spots;
}

std::unique_ptr<RuinProcedure> MakeRuinProcedure(
    RuinOperator::Value ruin_operator, const Problem* problem,
    std::mt19937* rnd) {
  switch (ruin_operator) {
    case RuinOperator::RANDOM:
      return std::make_unique<RandomRemovalRuinProcedure>(problem, rnd);
    case RuinOperator::WORST:
      return std::make_unique<WorstRemovalRuinProcedure>(problem);
    case RuinOperator::RELATED:
      return std::make_unique<RelatedRemovalRuinProcedure>(problem, rnd);
    default:
      LOG(DFATAL) << "Unsupported ruin operator: "
                  << GetRuinOperatorName(ruin_operator);
      return nullptr;
  }
}

int InsertWorkers(const Problem& problem, int spot, int workers,
                  std::vector<int>* vehicle_loads, Solution* solution) {
  std::vector<int>& loads = *vehicle_loads;
  if (workers <= 0) return 0;
  for (const int v : problem.vehicles_by_cost()) {
    if (problem.vehicle(v).capacity() - loads[v] >= workers) {
      solution->AddAssignment(spot, v, workers);
      loads[v] += workers;
      return 0;
    }
  }
  int remaining = workers;
  for (const int v : problem.vehicles_by_cost()) {
    if (remaining == 0) break;
    const int available = problem.vehicle(v).capacity() - loads[v];
    if (available <= 0) continue;
    const int pickup = std::min(remaining, available);
    solution->AddAssignment(spot, v, pickup);
    loads[v] += pickup;
    remaining -= pickup;
  }
  return remaining;
}

bool RecreateSpots(const Problem& problem, absl::Span<const int> spots,
                   Solution* solution) {
  std::vector<int> sorted_spots(spots.begin(), spots.end());
  std::sort(sorted_spots.begin(), sorted_spots.end());
  std::vector<int> loads = ComputeVehicleLoads(problem, *solution);
  bool all_inserted = true;
  for (const int spot : sorted_spots) {
    const int missing = InsertWorkers(
        problem, spot, problem.spot(spot).worker_count(), &loads, solution);
    if (missing > 0) {
      VLOG(2) << missing << " workers of spot " << problem.spot(spot).id()
              << " could not be inserted";
      all_inserted = false;
    }
  }
  return all_inserted;
}

std::string RuinAndRecreateStatistics::DebugString() const {
  std::string out =
      absl::StrCat("iterations: ", num_iterations,
                   " improvements: ", num_improvements,
                   " infeasible candidates: ", num_infeasible);
  for (const RuinOperatorStatistics& stats : operators) {
    absl::StrAppend(&out, "\n  ", GetRuinOperatorName(stats.ruin_operator),
                    ": calls: ", stats.num_calls,
                    " improvements: ", stats.num_improvements,
                    " infeasible: ", stats.num_infeasible);
  }
  return out;
}

RuinAndRecreateSearch::RuinAndRecreateSearch(
    const Problem* problem, const ShuttleSearchParameters& parameters)
    : problem_(*problem),
      parameters_(parameters),
      rnd_(parameters.random_seed()) {
  for (const RuinOperator::Value ruin_operator : GetRuinOperators(parameters)) {
    std::unique_ptr<RuinProcedure> ruin =
        MakeRuinProcedure(ruin_operator, problem, &rnd_);
    if (ruin == nullptr) continue;
    ruins_.push_back(std::move(ruin));
    RuinOperatorStatistics stats;
    stats.ruin_operator = ruin_operator;
    statistics_.operators.push_back(stats);
  }
}

int RuinAndRecreateSearch::PickNumSpotsToRemove() {
  const int num_spots = problem_.num_spots();
  const int min_removed = std::min(parameters_.min_removed_spots(), num_spots);
  const int max_removed = std::min(parameters_.max_removed_spots(), num_spots);
  std::uniform_int_distribution<int> dist(min_removed, max_removed);
  return dist(rnd_);
}

Solution RuinAndRecreateSearch::Run(const Solution& initial) {
  Solution best = initial;
  const int num_spots = problem_.num_spots();
  if (num_spots == 0 || ruins_.empty()) return best;

  std::vector<bool> removed(num_spots, false);
  for (int iteration = 0; iteration < parameters_.num_iterations();
       ++iteration) {
    ++statistics_.num_iterations;
    std::uniform_int_distribution<int> ruin_dist(
        0, static_cast<int>(ruins_.size()) - 1);
    const int ruin_index = ruin_dist(rnd_);
    const int num_spots_to_remove = PickNumSpotsToRemove();
    RuinOperatorStatistics& stats = statistics_.operators[ruin_index];
    ++stats.num_calls;

    const std::vector<int> removed_spots =
        ruins_[ruin_index]->Ruin(best, num_spots_to_remove);
    std::fill(removed.begin(), removed.end(), false);
    for (const int spot : removed_spots) removed[spot] = true;

    Solution candidate = best;
    candidate.RemoveSpots(removed);
    if (!RecreateSpots(problem_, removed_spots, &candidate) ||
        !IsValidSolution(problem_, candidate)) {
      ++statistics_.num_infeasible;
      ++stats.num_infeasible;
      VLOG(1) << "Iteration " << iteration << ": infeasible candidate after "
              << GetRuinOperatorName(stats.ruin_operator) << " removal of "
              << removed_spots.size() << " spots";
      continue;
    }
    EvaluateSolution(problem_, &candidate);
    if (candidate.total_cost() < best.total_cost()) {
      ++statistics_.num_improvements;
      ++stats.num_improvements;
      if (parameters_.log_search()) {
        LOG(INFO) << "Iteration " << iteration << " ("
                  << GetRuinOperatorName(stats.ruin_operator)
                  << "): cost " << best.total_cost() << " -> "
                  << candidate.total_cost() << ", distance "
                  << candidate.total_distance() << " km, vehicles "
                  << candidate.vehicles_used();
      }
      best = std::move(candidate);
    }
  }
  if (parameters_.log_search()) {
    LOG(INFO) << "Ruin and recreate search done, "
              << statistics_.DebugString();
  }
  return best;
}

}  // namespace shuttle::routing
