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

#include "shuttle/geo/great_circle.h"

#include <algorithm>
#include <cmath>

#include "absl/log/check.h"

namespace shuttle::geo {
namespace {

double ToRadians(double degrees) { return degrees * M_PI / 180.0; }

}  // namespace

double GreatCircleDistanceKm(double from_latitude, double from_longitude,
                             double to_latitude, double to_longitude) {
  const double lat1 = ToRadians(from_latitude);
  const double lat2 = ToRadians(to_latitude);
  const double dlat = lat2 - lat1;
  const double dlon = ToRadians(to_longitude - from_longitude);
  const double sin_dlat = std::sin(dlat / 2);
  const double sin_dlon = std::sin(dlon / 2);
  const double a =
      sin_dlat * sin_dlat + std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;
  // Rounding can push a slightly above 1 for antipodal points.
  return 2 * kEarthRadiusKm * std::asin(std::sqrt(std::min(1.0, a)));
}

double TravelMinutes(double distance_km, double speed_kmh) {
  DCHECK_GT(speed_kmh, 0);
  return distance_km / speed_kmh * 60.0;
}

}  // namespace shuttle::geo
