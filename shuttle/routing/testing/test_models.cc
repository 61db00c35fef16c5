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

#include "shuttle/routing/testing/test_models.h"

#include <cmath>
#include <memory>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shuttle/routing/distance_cache.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/problem.h"

namespace shuttle::routing::test {

absl::StatusOr<double> PlanarDistanceProvider::Distance(const GeoPoint& from,
                                                        const GeoPoint& to) {
  ++num_distance_calls_;
  return std::hypot(to.latitude() - from.latitude(),
                    to.longitude() - from.longitude());
}

absl::StatusOr<RouteGeometry> PlanarDistanceProvider::GetRouteGeometry(
    absl::Span<const GeoPoint> points) {
  if (points.size() < 2) {
    return absl::InvalidArgumentError("Not enough points");
  }
  RouteGeometry geometry;
  geometry.waypoints.assign(points.begin(), points.end());
  for (int i = 1; i < points.size(); ++i) {
    geometry.total_distance_km +=
        std::hypot(points[i].latitude() - points[i - 1].latitude(),
                   points[i].longitude() - points[i - 1].longitude());
  }
  geometry.total_duration_minutes = geometry.total_distance_km;
  return geometry;
}

GeoPoint MakePoint(double latitude, double longitude) {
  GeoPoint point;
  point.set_latitude(latitude);
  point.set_longitude(longitude);
  return point;
}

ShuttleRoutingModel MakeModel(double latitude, double longitude) {
  ShuttleRoutingModel model;
  model.mutable_factory()->set_name("factory");
  *model.mutable_factory()->mutable_location() =
      MakePoint(latitude, longitude);
  return model;
}

void AddVehicle(absl::string_view id, int capacity, double cost_per_km,
                ShuttleRoutingModel* model) {
  Vehicle* const vehicle = model->add_vehicles();
  vehicle->set_id(std::string(id));
  vehicle->set_name(std::string(id));
  vehicle->set_category(SELF_OWNED);
  vehicle->set_capacity(capacity);
  vehicle->set_cost_per_km(cost_per_km);
}

void AddPickupSpot(absl::string_view id, double latitude, double longitude,
                   int worker_count, ShuttleRoutingModel* model) {
  PickupSpot* const spot = model->add_pickup_spots();
  spot->set_id(std::string(id));
  spot->set_name(std::string(id));
  *spot->mutable_location() = MakePoint(latitude, longitude);
  spot->set_worker_count(worker_count);
}

std::unique_ptr<Problem> MakePlanarProblem(const ShuttleRoutingModel& model,
                                           double vehicle_usage_penalty) {
  PlanarDistanceProvider provider;
  absl::StatusOr<DistanceCache> distances =
      DistanceCache::Build(model, &provider);
  CHECK_OK(distances.status());
  return std::make_unique<Problem>(&model, *std::move(distances),
                                   vehicle_usage_penalty);
}

}  // namespace shuttle::routing::test
