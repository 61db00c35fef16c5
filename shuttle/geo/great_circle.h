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

#ifndef SHUTTLE_GEO_GREAT_CIRCLE_H_
#define SHUTTLE_GEO_GREAT_CIRCLE_H_

namespace shuttle::geo {

// Mean Earth radius used by the haversine formula.
inline constexpr double kEarthRadiusKm = 6371.0;

// Returns the great-circle distance in kilometers between two points given in
// degrees, computed with the haversine formula.
double GreatCircleDistanceKm(double from_latitude, double from_longitude,
                             double to_latitude, double to_longitude);

// Travel time in minutes of distance_km at a constant speed.
double TravelMinutes(double distance_km, double speed_kmh);

}  // namespace shuttle::geo

#endif  // SHUTTLE_GEO_GREAT_CIRCLE_H_
