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

#include "shuttle/routing/model_validation.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "shuttle/base/status_macros.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {
namespace {

using ::absl::InvalidArgumentError;

// Worker counts and vehicle loads are held in int.
constexpr int64_t kMaxTotalWorkers = std::numeric_limits<int32_t>::max();

absl::Status ValidateLocation(const GeoPoint& point,
                              absl::string_view context) {
  if (const absl::Status status = ValidateGeoPoint(point); !status.ok()) {
    return InvalidArgumentError(absl::StrCat(context, ": ", status.message()));
  }
  return absl::OkStatus();
}

absl::Status ValidateVehicle(const Vehicle& vehicle, int index) {
  const std::string context = absl::StrCat("vehicles[", index, "]");
  if (vehicle.id().empty()) {
    return InvalidArgumentError(absl::StrCat(context, " has an empty id"));
  }
  if (vehicle.capacity() <= 0) {
    return InvalidArgumentError(
        absl::StrCat(context, " (", vehicle.id(), ") has capacity ",
                     vehicle.capacity(), ", it must be positive"));
  }
  if (!std::isfinite(vehicle.cost_per_km()) || vehicle.cost_per_km() <= 0) {
    return InvalidArgumentError(
        absl::StrCat(context, " (", vehicle.id(), ") has cost_per_km ",
                     vehicle.cost_per_km(), ", it must be positive"));
  }
  return absl::OkStatus();
}

absl::Status ValidatePickupSpot(const PickupSpot& spot, int index) {
  const std::string context = absl::StrCat("pickup_spots[", index, "]");
  if (spot.id().empty()) {
    return InvalidArgumentError(absl::StrCat(context, " has an empty id"));
  }
  if (!spot.has_location()) {
    return InvalidArgumentError(
        absl::StrCat(context, " (", spot.id(), ") has no location"));
  }
  RETURN_IF_ERROR(ValidateLocation(spot.location(), context));
  if (spot.worker_count() <= 0) {
    return InvalidArgumentError(
        absl::StrCat(context, " (", spot.id(), ") has worker_count ",
                     spot.worker_count(), ", it must be positive"));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateGeoPoint(const GeoPoint& point) {
  if (!std::isfinite(point.latitude()) || point.latitude() < -90 ||
      point.latitude() > 90) {
    return InvalidArgumentError(
        absl::StrCat("latitude ", point.latitude(), " is not in [-90, 90]"));
  }
  if (!std::isfinite(point.longitude()) || point.longitude() < -180 ||
      point.longitude() > 180) {
    return InvalidArgumentError(absl::StrCat(
        "longitude ", point.longitude(), " is not in [-180, 180]"));
  }
  return absl::OkStatus();
}

absl::Status ValidateShuttleRoutingModel(const ShuttleRoutingModel& model) {
  if (!model.has_factory() || !model.factory().has_location()) {
    return InvalidArgumentError("The model has no factory location");
  }
  RETURN_IF_ERROR(ValidateLocation(model.factory().location(), "factory"));

  absl::flat_hash_set<std::string> ids;
  absl::flat_hash_set<std::string> names;
  int64_t total_capacity = 0;
  for (int v = 0; v < model.vehicles_size(); ++v) {
    const Vehicle& vehicle = model.vehicles(v);
    RETURN_IF_ERROR(ValidateVehicle(vehicle, v));
    if (!ids.insert(vehicle.id()).second) {
      return InvalidArgumentError(
          absl::StrCat("Duplicate vehicle id '", vehicle.id(), "'"));
    }
    if (!names.insert(vehicle.name()).second) {
      return InvalidArgumentError(
          absl::StrCat("Duplicate vehicle name '", vehicle.name(), "'"));
    }
    total_capacity += vehicle.capacity();
  }
  if (total_capacity > kMaxTotalWorkers) {
    return InvalidArgumentError(absl::StrCat(
        "The total capacity ", total_capacity, " exceeds ", kMaxTotalWorkers));
  }

  ids.clear();
  names.clear();
  int64_t total_workers = 0;
  for (int s = 0; s < model.pickup_spots_size(); ++s) {
    const PickupSpot& spot = model.pickup_spots(s);
    RETURN_IF_ERROR(ValidatePickupSpot(spot, s));
    if (!ids.insert(spot.id()).second) {
      return InvalidArgumentError(
          absl::StrCat("Duplicate pickup spot id '", spot.id(), "'"));
    }
    if (!names.insert(spot.name()).second) {
      return InvalidArgumentError(
          absl::StrCat("Duplicate pickup spot name '", spot.name(), "'"));
    }
    total_workers += spot.worker_count();
  }
  if (total_workers > kMaxTotalWorkers) {
    return InvalidArgumentError(absl::StrCat("The total worker count ",
                                             total_workers, " exceeds ",
                                             kMaxTotalWorkers));
  }
  return absl::OkStatus();
}

}  // namespace shuttle::routing
