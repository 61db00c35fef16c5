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

#include "shuttle/routing/distance_provider.h"

#include <cmath>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "shuttle/geo/great_circle.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {

StraightLineDistanceProvider::StraightLineDistanceProvider(double speed_kmh)
    : speed_kmh_(speed_kmh) {
  CHECK_GT(speed_kmh_, 0);
}

absl::StatusOr<double> StraightLineDistanceProvider::Distance(
    const GeoPoint& from, const GeoPoint& to) {
  return geo::GreatCircleDistanceKm(from.latitude(), from.longitude(),
                                    to.latitude(), to.longitude());
}

absl::StatusOr<RouteGeometry> StraightLineDistanceProvider::GetRouteGeometry(
    absl::Span<const GeoPoint> points) {
  if (points.size() < 2) {
    return absl::InvalidArgumentError(
        "A route geometry needs at least two points");
  }
  RouteGeometry geometry;
  geometry.waypoints.assign(points.begin(), points.end());
  for (int i = 1; i < points.size(); ++i) {
    const GeoPoint& from = points[i - 1];
    const GeoPoint& to = points[i];
    geometry.total_distance_km += geo::GreatCircleDistanceKm(
        from.latitude(), from.longitude(), to.latitude(), to.longitude());
  }
  geometry.total_duration_minutes =
      geo::TravelMinutes(geometry.total_distance_km, speed_kmh_);
  return geometry;
}

FallbackDistanceProvider::FallbackDistanceProvider(DistanceProvider* primary,
                                                   double speed_kmh)
    : primary_(primary), fallback_(speed_kmh) {
  CHECK(primary_ != nullptr);
}

absl::StatusOr<double> FallbackDistanceProvider::Distance(const GeoPoint& from,
                                                          const GeoPoint& to) {
  const absl::StatusOr<double> distance = primary_->Distance(from, to);
  if (distance.ok() && std::isfinite(*distance) && *distance >= 0) {
    return *distance;
  }
  ++num_fallbacks_;
  if (distance.ok()) {
    LOG(WARNING) << "Road distance " << *distance
                 << " is not usable, falling back to straight line";
  } else {
    LOG(WARNING) << "Road distance unavailable (" << distance.status()
                 << "), falling back to straight line";
  }
  return fallback_.Distance(from, to);
}

absl::StatusOr<RouteGeometry> FallbackDistanceProvider::GetRouteGeometry(
    absl::Span<const GeoPoint> points) {
  absl::StatusOr<RouteGeometry> geometry = primary_->GetRouteGeometry(points);
  if (geometry.ok() && !geometry->waypoints.empty()) {
    return geometry;
  }
  ++num_fallbacks_;
  if (!geometry.ok()) {
    LOG(WARNING) << "Road geometry unavailable (" << geometry.status()
                 << "), falling back to straight lines";
  } else {
    LOG(WARNING) << "Road geometry is empty, falling back to straight lines";
  }
  return fallback_.GetRouteGeometry(points);
}

}  // namespace shuttle::routing
