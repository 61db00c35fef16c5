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

// Large neighborhood search improving a shuttle routing solution by
// repeatedly removing the workers of a few pickup spots from the best known
// solution (ruin) and inserting them back greedily (recreate).

#ifndef SHUTTLE_ROUTING_RUIN_RECREATE_H_
#define SHUTTLE_ROUTING_RUIN_RECREATE_H_

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

// Selects the pickup spots to remove from a solution.
class RuinProcedure {
 public:
  virtual ~RuinProcedure() = default;

  // Returns at most `num_spots` distinct spot indices to remove from
  // `solution`.
  virtual std::vector<int> Ruin(const Solution& solution, int num_spots) = 0;
};

// Removes spots drawn uniformly at random.
class RandomRemovalRuinProcedure : public RuinProcedure {
 public:
  RandomRemovalRuinProcedure(const Problem* problem, std::mt19937* rnd);
  std::vector<int> Ruin(const Solution& solution, int num_spots) override;

 private:
  const Problem& problem_;
  std::mt19937& rnd_;
};

// Removes the served spots with the highest estimated cost. The cost of a
// spot is estimated as the round trip from the factory at the average cost
// per km of the fleet, paid once per vehicle serving the spot. Ties are
// broken by spot index.
class WorstRemovalRuinProcedure : public RuinProcedure {
 public:
  explicit WorstRemovalRuinProcedure(const Problem* problem);
  std::vector<int> Ruin(const Solution& solution, int num_spots) override;

 private:
  const Problem& problem_;
};

// Removes a cluster of spots: starts from a random spot, then repeatedly adds
// the spot with the smallest sum of distances to the spots already removed.
// Ties are broken by spot index.
class RelatedRemovalRuinProcedure : public RuinProcedure {
 public:
  RelatedRemovalRuinProcedure(const Problem* problem, std::mt19937* rnd);
  std::vector<int> Ruin(const Solution& solution, int num_spots) override;

 private:
  const Problem& problem_;
  std::mt19937& rnd_;
};

// Returns a ruin procedure of the given type, or nullptr if the type is not
// supported. `problem` and `rnd` must outlive the returned procedure.
std::unique_ptr<RuinProcedure> MakeRuinProcedure(
    RuinOperator::Value ruin_operator, const Problem* problem,
    std::mt19937* rnd);

// Assigns `workers` workers of `spot` to the vehicles, cheapest cost per km
// first: the first vehicle with enough seats left takes all of them,
// otherwise they are split over the vehicles in cost order, each one taking
// as many as it can. `vehicle_loads` holds the current load of each vehicle
// and is updated. Returns the number of workers which could not be placed.
int InsertWorkers(const Problem& problem, int spot, int workers,
                  std::vector<int>* vehicle_loads, Solution* solution);

// Inserts back all the workers of `spots` into `solution` with
// InsertWorkers(), processing the spots by increasing index. Returns false if
// some workers could not be placed.
bool RecreateSpots(const Problem& problem, absl::Span<const int> spots,
                   Solution* solution);

struct RuinOperatorStatistics {
  RuinOperator::Value ruin_operator = RuinOperator::UNSET;
  int64_t num_calls = 0;
  int64_t num_improvements = 0;
  int64_t num_infeasible = 0;
};

struct RuinAndRecreateStatistics {
  int64_t num_iterations = 0;
  int64_t num_improvements = 0;
  int64_t num_infeasible = 0;
  std::vector<RuinOperatorStatistics> operators;

  std::string DebugString() const;
};

// Improves a solution with ruin and recreate iterations. Only candidates
// which are valid and strictly cheaper than the best solution replace it, so
// the cost of the best solution never increases.
//
// All the random choices are drawn from a std::mt19937 seeded with
// parameters.random_seed(): two searches with the same problem, parameters
// and initial solution return the same solution.
class RuinAndRecreateSearch {
 public:
  // Does not take ownership of `problem`, which must outlive this object.
  // `parameters` must be valid.
  RuinAndRecreateSearch(const Problem* problem,
                        const ShuttleSearchParameters& parameters);

  RuinAndRecreateSearch(const RuinAndRecreateSearch&) = delete;
  RuinAndRecreateSearch& operator=(const RuinAndRecreateSearch&) = delete;

  // Runs parameters.num_iterations() iterations starting from `initial`,
  // which must be evaluated, and returns the best solution found.
  Solution Run(const Solution& initial);

  const RuinAndRecreateStatistics& statistics() const { return statistics_; }

 private:
  // Returns the number of spots to remove in the next iteration.
  int PickNumSpotsToRemove();

  const Problem& problem_;
  const ShuttleSearchParameters parameters_;
  std::mt19937 rnd_;
  std::vector<std::unique_ptr<RuinProcedure>> ruins_;
  RuinAndRecreateStatistics statistics_;
};

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_RUIN_RECREATE_H_
