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

#ifndef SHUTTLE_ROUTING_PROBLEM_H_
#define SHUTTLE_ROUTING_PROBLEM_H_

#include <cstdint>
#include <vector>

#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {

// Read-only view of one optimization run: the model, the precomputed
// distances and the data derived from them which the heuristics share.
class Problem {
 public:
  // Does not take ownership of `model`, which must outlive this object.
  Problem(const ShuttleRoutingModel* model, DistanceCache distances,
          double vehicle_usage_penalty);

  const ShuttleRoutingModel& model() const { return *model_; }
  const DistanceCache& distances() const { return distances_; }

  int num_vehicles() const { return model_->vehicles_size(); }
  int num_spots() const { return model_->pickup_spots_size(); }
  const Vehicle& vehicle(int v) const { return model_->vehicles(v); }
  const PickupSpot& spot(int s) const { return model_->pickup_spots(s); }

  // Vehicle indices sorted by increasing cost per km; vehicles with the same
  // cost keep their input order.
  const std::vector<int>& vehicles_by_cost() const {
    return vehicles_by_cost_;
  }

  // Mean of cost_per_km over all vehicles, 0 when there is no vehicle.
  double average_cost_per_km() const { return average_cost_per_km_; }
  double vehicle_usage_penalty() const { return vehicle_usage_penalty_; }

  int64_t total_demand() const { return total_demand_; }
  int64_t total_capacity() const { return total_capacity_; }

 private:
  const ShuttleRoutingModel* const model_;
  const DistanceCache distances_;
  const double vehicle_usage_penalty_;
  std::vector<int> vehicles_by_cost_;
  double average_cost_per_km_ = 0.0;
  int64_t total_demand_ = 0;
  int64_t total_capacity_ = 0;
};

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_PROBLEM_H_
