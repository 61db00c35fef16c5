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

#ifndef SHUTTLE_ROUTING_PARAMETERS_H_
#define SHUTTLE_ROUTING_PARAMETERS_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "shuttle/routing/parameters.pb.h"

namespace shuttle::routing {

ShuttleSearchParameters DefaultShuttleSearchParameters();

/// Returns a list of std::string describing the errors in the search
/// parameters. Returns an empty vector if the parameters are valid.
std::vector<std::string> FindErrorsInShuttleSearchParameters(
    const ShuttleSearchParameters& parameters);

/// Returns an InvalidArgumentError listing all the errors found by
/// FindErrorsInShuttleSearchParameters(), if any.
absl::Status ValidateShuttleSearchParameters(
    const ShuttleSearchParameters& parameters);

/// Returns the operators the search picks from: parameters.ruin_operators(),
/// or all of them when none is given.
std::vector<RuinOperator::Value> GetRuinOperators(
    const ShuttleSearchParameters& parameters);

std::string GetRuinOperatorName(RuinOperator::Value ruin_operator);

}  // namespace shuttle::routing

#endif  // SHUTTLE_ROUTING_PARAMETERS_H_
