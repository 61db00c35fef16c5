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

#include "shuttle/routing/parameters.h"

#include <cmath>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "shuttle/routing/parameters.pb.h"

namespace shuttle::routing {

ShuttleSearchParameters DefaultShuttleSearchParameters() {
  ShuttleSearchParameters parameters;
  parameters.set_num_iterations(100);
  parameters.set_random_seed(0);
  parameters.set_vehicle_usage_penalty(1000);
  parameters.set_min_removed_spots(2);
  parameters.set_max_removed_spots(5);
  parameters.set_consolidate(true);
  parameters.set_use_real_roads(false);
  parameters.set_fallback_speed_kmh(40);
  parameters.set_log_search(false);
  return parameters;
}

std::vector<std::string> FindErrorsInShuttleSearchParameters(
    const ShuttleSearchParameters& parameters) {
  using absl::StrCat;
  std::vector<std::string> errors;
  if (parameters.num_iterations() < 0) {
    errors.emplace_back(
        StrCat("Invalid num_iterations: ", parameters.num_iterations()));
  }
  if (!std::isfinite(parameters.vehicle_usage_penalty()) ||
      parameters.vehicle_usage_penalty() < 0) {
    errors.emplace_back(StrCat("Invalid vehicle_usage_penalty: ",
                               parameters.vehicle_usage_penalty()));
  }
  if (parameters.min_removed_spots() < 1) {
    errors.emplace_back(
        StrCat("Invalid min_removed_spots: ", parameters.min_removed_spots()));
  }
  if (parameters.max_removed_spots() < parameters.min_removed_spots()) {
    errors.emplace_back(StrCat("Invalid max_removed_spots: ",
                               parameters.max_removed_spots(),
                               " < min_removed_spots ",
                               parameters.min_removed_spots()));
  }
  for (const int ruin_operator : parameters.ruin_operators()) {
    if (ruin_operator == RuinOperator::UNSET ||
        !RuinOperator::Value_IsValid(ruin_operator)) {
      errors.emplace_back(StrCat("Invalid ruin operator: ", ruin_operator));
    }
  }
  if (!std::isfinite(parameters.fallback_speed_kmh()) ||
      parameters.fallback_speed_kmh() <= 0) {
    errors.emplace_back(StrCat("Invalid fallback_speed_kmh: ",
                               parameters.fallback_speed_kmh()));
  }
  return errors;
}

absl::Status ValidateShuttleSearchParameters(
    const ShuttleSearchParameters& parameters) {
  const std::vector<std::string> errors =
      FindErrorsInShuttleSearchParameters(parameters);
  if (errors.empty()) return absl::OkStatus();
  return absl::InvalidArgumentError(absl::StrCat(
      "Invalid ShuttleSearchParameters: ", absl::StrJoin(errors, "; ")));
}

std::vector<RuinOperator::Value> GetRuinOperators(
    const ShuttleSearchParameters& parameters) {
  if (parameters.ruin_operators().empty()) {
    return {RuinOperator::RANDOM, RuinOperator::WORST, RuinOperator::RELATED};
  }
  std::vector<RuinOperator::Value> ruin_operators;
  ruin_operators.reserve(parameters.ruin_operators_size());
  for (const int ruin_operator : parameters.ruin_operators()) {
    ruin_operators.push_back(static_cast<RuinOperator::Value>(ruin_operator));
  }
  return ruin_operators;
}

std::string GetRuinOperatorName(RuinOperator::Value ruin_operator) {
  switch (ruin_operator) {
    case RuinOperator::RANDOM:
      return "random";
    case RuinOperator::WORST:
      return "worst";
    case RuinOperator::RELATED:
      return "related";
    case RuinOperator::UNSET:
      return "UNSET";
    default:
      LOG(DFATAL) << "Unsupported ruin operator " << ruin_operator;
      return "unknown";
  }
}

}  // namespace shuttle::routing
