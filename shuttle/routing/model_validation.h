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

#ifndef SHUTTLE_ROUTING_MODEL_VALIDATION_H_
#define SHUTTLE_ROUTING_MODEL_VALIDATION_H_

#include "absl/status/status.h"
#include "shuttle/routing/model.pb.h"

namespace shuttle::routing {

// Returns InvalidArgumentError with a description of the first problem found
// if `point` has out of range or non finite coordinates.
absl::Status ValidateGeoPoint(const GeoPoint& point);

// Checks that the model can be optimized: factory present with valid
// coordinates, vehicles with unique non-empty ids, unique names, positive
// capacities and positive finite costs, pickup spots with unique non-empty
// ids, unique names, valid coordinates and positive worker counts. The total
// capacity and the total worker count must both fit in an int32.
// A model without vehicles or without pickup spots is valid.
absl::Status ValidateShuttleRoutingModel(const ShuttleRoutingModel& model);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_MODEL_VALIDATION_H_
