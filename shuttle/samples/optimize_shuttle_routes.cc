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

// Optimizes the shuttle routes of a ShuttleRoutingModel read from a file, in
// text or binary proto format, using great-circle distances.
//
// Example:
//   optimize_shuttle_routes --input=shuttle/samples/data/sample_model.textproto
//     --params="num_iterations: 500 random_seed: 7" --output_json

#include <cstdlib>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"
#include "shuttle/base/file.h"
#include "shuttle/base/status_macros.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/optimizer.h"
#include "shuttle/routing/parameters.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/result.pb.h"

ABSL_FLAG(std::string, input, "",
          "ShuttleRoutingModel file name, in text or binary proto format.");
ABSL_FLAG(std::string, params, "",
          "ShuttleSearchParameters in text format, overriding the defaults.");
ABSL_FLAG(std::string, output, "",
          "File where the OptimizationResult is written; stdout if empty.");
ABSL_FLAG(bool, output_json, false,
          "Write the result in JSON instead of proto text format.");

namespace shuttle::routing {
namespace {

absl::StatusOr<std::string> FormatResult(const OptimizationResult& result,
                                         bool json) {
  std::string output;
  if (json) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;
    const auto status =
        google::protobuf::util::MessageToJsonString(result, &output, options);
    if (!status.ok()) {
      return absl::InternalError(
          std::string("Cannot convert the result to JSON: ") +
          std::string(status.message()));
    }
  } else if (!google::protobuf::TextFormat::PrintToString(result, &output)) {
    return absl::InternalError("Cannot print the result in text format");
  }
  return output;
}

absl::Status Run() {
  ShuttleRoutingModel model;
  RETURN_IF_ERROR(file::GetTextProto(absl::GetFlag(FLAGS_input), &model));

  ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  if (!google::protobuf::TextFormat::MergeFromString(
          absl::GetFlag(FLAGS_params), &parameters)) {
    return absl::InvalidArgumentError("Cannot parse --params");
  }
  // Real road distances need a road routing service, which this driver does
  // not have.
  parameters.set_use_real_roads(false);

  LOG(INFO) << "Optimizing '" << model.factory().name() << "' with "
            << model.vehicles_size() << " vehicles and "
            << model.pickup_spots_size() << " pickup spots";
  ASSIGN_OR_RETURN(const OptimizationResult result,
                   Optimize(model, parameters));
  LOG(INFO) << "Cost: " << result.total_cost()
            << ", distance: " << result.total_distance()
            << " km, vehicles: " << result.total_vehicles_used()
            << ", unassigned workers: " << result.unassigned_workers();

  const std::string output_file = absl::GetFlag(FLAGS_output);
  const bool json = absl::GetFlag(FLAGS_output_json);
  if (!output_file.empty() && !json) {
    return file::SetTextProto(output_file, result);
  }
  ASSIGN_OR_RETURN(const std::string output, FormatResult(result, json));
  if (output_file.empty()) {
    std::cout << output;
    return absl::OkStatus();
  }
  return file::SetContents(output_file, output);
}

}  // namespace
}  // namespace shuttle::routing

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  absl::InitializeLog();
  if (absl::GetFlag(FLAGS_input).empty()) {
    LOG(FATAL) << "Please supply a data file with --input=";
  }
  const absl::Status status = shuttle::routing::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
