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

#ifndef SHUTTLE_BASE_FILE_H_
#define SHUTTLE_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace file {

// Reads the whole content of a file.
absl::StatusOr<std::string> GetContents(absl::string_view file_name);

// Replaces the content of a file, creating it if needed.
absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents);

// Reads a proto from a file, in text format or else in binary format.
absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto);

// Writes a proto to a file in text format.
absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto);

}  // namespace file

#endif  // SHUTTLE_BASE_FILE_H_
