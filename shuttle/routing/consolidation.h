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

#ifndef SHUTTLE_ROUTING_CONSOLIDATION_H_
#define SHUTTLE_ROUTING_CONSOLIDATION_H_

#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {

// Rebuilds the assignments of `solution` from scratch to pack the workers
// into the cheapest vehicles: each spot, taken in input order, keeps the
// number of workers it has in `solution` and is inserted with
// InsertWorkers().
//
// The rebuilt solution is returned, evaluated, if it is valid and either
// strictly cheaper or uses strictly fewer vehicles than `solution`, which
// must be evaluated. Otherwise `solution` is returned unchanged.
Solution ConsolidateRoutes(const Problem& problem, const Solution& solution);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_CONSOLIDATION_H_
