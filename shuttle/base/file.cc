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

#include "shuttle/base/file.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace file {

absl::StatusOr<std::string> GetContents(absl::string_view file_name) {
  std::ifstream stream{std::string(file_name), std::ios::in | std::ios::binary};
  if (!stream.is_open()) {
    return absl::NotFoundError(
        absl::StrCat("Could not open '", file_name, "'."));
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  if (stream.bad()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", file_name, "'."));
  }
  return contents.str();
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  std::ofstream stream{std::string(file_name),
                       std::ios::out | std::ios::binary | std::ios::trunc};
  if (!stream.is_open()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "' for writing."));
  }
  stream.write(contents.data(), contents.size());
  stream.close();  // Even if write() fails!
  if (stream.fail()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write to '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  const absl::StatusOr<std::string> str = GetContents(file_name);
  if (!str.ok()) {
    VLOG(1) << "Could not read '" << file_name << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read proto from '", file_name, "'."));
  }
  // Attempt to decode ASCII before deciding binary: it is much harder for a
  // binary encoding to happen to be a valid ASCII encoding than the other way
  // around.
  if (google::protobuf::TextFormat::ParseFromString(*str, proto)) {
    return absl::OkStatus();
  }
  if (proto->ParseFromString(*str)) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Could not parse a ", proto->GetTypeName(), " from '",
                   file_name, "'."));
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print proto for '", file_name, "'."));
  }
  return SetContents(file_name, proto_string);
}

}  // namespace file
