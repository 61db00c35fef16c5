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

#ifndef SHUTTLE_ROUTING_GREEDY_CONSTRUCTION_H_
#define SHUTTLE_ROUTING_GREEDY_CONSTRUCTION_H_

#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

// Builds a first solution by filling the vehicles one at a time, cheapest
// cost per km first, with the spots taken by decreasing worker count. A spot
// which does not fit in the remaining capacity of a vehicle is split: the
// vehicle takes as many workers as it has seats left and the rest is carried
// over to the next vehicle.
//
// When the fleet cannot carry all the workers, the returned solution leaves
// some workers unassigned and is therefore not valid. The returned solution
// is evaluated.
Solution BuildGreedySolution(const Problem& problem);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_GREEDY_CONSTRUCTION_H_
