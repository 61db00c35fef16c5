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

#ifndef SHUTTLE_ROUTING_DISTANCE_PROVIDER_H_
#define SHUTTLE_ROUTING_DISTANCE_PROVIDER_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/result.pb.h"

namespace shuttle::routing {

// Geometry of a path going through a sequence of points.
struct RouteGeometry {
  double total_distance_km = 0.0;
  double total_duration_minutes = 0.0;
  // Polyline following the path, including the first and last points.
  std::vector<GeoPoint> waypoints;
  // Turn-by-turn instructions, empty when the provider has none.
  std::vector<RouteStep> steps;
};

// Source of travel distances between geographic points. Implementations
// backed by a remote road routing service are expected to enforce their own
// request timeout and to report any failure as an error status.
class DistanceProvider {
 public:
  virtual ~DistanceProvider() = default;

  // Returns the travel distance in kilometers from `from` to `to`.
  virtual absl::StatusOr<double> Distance(const GeoPoint& from,
                                          const GeoPoint& to) = 0;

  // Returns the geometry of the path visiting `points` in order. Requires at
  // least two points.
  virtual absl::StatusOr<RouteGeometry> GetRouteGeometry(
      absl::Span<const GeoPoint> points) = 0;
};

// Great-circle distances and straight segments. Never fails.
class StraightLineDistanceProvider : public DistanceProvider {
 public:
  static constexpr double kDefaultSpeedKmh = 40.0;

  // `speed_kmh` is used to estimate durations and must be positive.
  explicit StraightLineDistanceProvider(double speed_kmh = kDefaultSpeedKmh);

  absl::StatusOr<double> Distance(const GeoPoint& from,
                                  const GeoPoint& to) override;

  absl::StatusOr<RouteGeometry> GetRouteGeometry(
      absl::Span<const GeoPoint> points) override;

  double speed_kmh() const { return speed_kmh_; }

 private:
  const double speed_kmh_;
};

// Queries a primary provider, typically a road network service, and falls
// back to straight-line answers whenever it fails or returns a distance which
// is negative or not finite. Errors of the primary provider never propagate.
class FallbackDistanceProvider : public DistanceProvider {
 public:
  // Does not take ownership of `primary`, which must outlive this object.
  FallbackDistanceProvider(DistanceProvider* primary, double speed_kmh);

  absl::StatusOr<double> Distance(const GeoPoint& from,
                                  const GeoPoint& to) override;

  absl::StatusOr<RouteGeometry> GetRouteGeometry(
      absl::Span<const GeoPoint> points) override;

  // Number of answers which came from the straight-line fallback.
  int64_t num_fallbacks() const { return num_fallbacks_; }

 private:
  DistanceProvider* const primary_;
  StraightLineDistanceProvider fallback_;
  int64_t num_fallbacks_ = 0;
};

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_DISTANCE_PROVIDER_H_
