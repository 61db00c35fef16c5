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

#include "shuttle/routing/problem.h"

#include <algorithm>
#include <numeric>
#include <utility>

#include "absl/log/check.h"
#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {

Problem::Problem(const ShuttleRoutingModel* model, DistanceCache distances,
                 double vehicle_usage_penalty)
    : model_(model),
      distances_(std::move(distances)),
      vehicle_usage_penalty_(vehicle_usage_penalty) {
  CHECK(model_ != nullptr);
  CHECK_EQ(distances_.num_spots(), model_->pickup_spots_size());

  vehicles_by_cost_.resize(num_vehicles());
  std::iota(vehicles_by_cost_.begin(), vehicles_by_cost_.end(), 0);
  std::stable_sort(vehicles_by_cost_.begin(), vehicles_by_cost_.end(),
                   [this](int a, int b) {
                     return vehicle(a).cost_per_km() < vehicle(b).cost_per_km();
                   });

  double total_cost_per_km = 0.0;
  for (const Vehicle& vehicle : model_->vehicles()) {
    total_cost_per_km += vehicle.cost_per_km();
    total_capacity_ += vehicle.capacity();
  }
  if (num_vehicles() > 0) {
    average_cost_per_km_ = total_cost_per_km / num_vehicles();
  }
  for (const PickupSpot& spot : model_->pickup_spots()) {
    total_demand_ += spot.worker_count();
  }
}

}  // namespace shuttle::routing
