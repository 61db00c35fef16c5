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

#include <limits>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shuttle/routing/parameters.pb.h"

namespace shuttle::routing {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

TEST(ShuttleSearchParametersTest, DefaultsAreValid) {
  const ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  EXPECT_THAT(FindErrorsInShuttleSearchParameters(parameters), IsEmpty());
  EXPECT_EQ(parameters.num_iterations(), 100);
  EXPECT_EQ(parameters.min_removed_spots(), 2);
  EXPECT_EQ(parameters.max_removed_spots(), 5);
  EXPECT_EQ(parameters.vehicle_usage_penalty(), 1000);
  EXPECT_TRUE(parameters.consolidate());
  EXPECT_FALSE(parameters.use_real_roads());
  EXPECT_EQ(parameters.fallback_speed_kmh(), 40);
}

TEST(ShuttleSearchParametersTest, ReportsAllErrors) {
  ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  parameters.set_num_iterations(-1);
  parameters.set_vehicle_usage_penalty(
      std::numeric_limits<double>::infinity());
  parameters.set_min_removed_spots(3);
  parameters.set_max_removed_spots(2);
  parameters.set_fallback_speed_kmh(0);
  EXPECT_THAT(FindErrorsInShuttleSearchParameters(parameters), SizeIs(4));
  const absl::Status status = ValidateShuttleSearchParameters(parameters);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("num_iterations"));
  EXPECT_THAT(status.message(), HasSubstr("vehicle_usage_penalty"));
  EXPECT_THAT(status.message(), HasSubstr("max_removed_spots"));
  EXPECT_THAT(status.message(), HasSubstr("fallback_speed_kmh"));
}

TEST(ShuttleSearchParametersTest, ZeroMinRemovedSpots) {
  ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  parameters.set_min_removed_spots(0);
  EXPECT_THAT(ValidateShuttleSearchParameters(parameters).message(),
              HasSubstr("min_removed_spots"));
}

TEST(ShuttleSearchParametersTest, UnsetRuinOperator) {
  ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  parameters.add_ruin_operators(RuinOperator::UNSET);
  EXPECT_THAT(ValidateShuttleSearchParameters(parameters).message(),
              HasSubstr("ruin operator"));
}

TEST(GetRuinOperatorsTest, AllByDefault) {
  EXPECT_THAT(GetRuinOperators(DefaultShuttleSearchParameters()),
              ElementsAre(RuinOperator::RANDOM, RuinOperator::WORST,
                          RuinOperator::RELATED));
}

TEST(GetRuinOperatorsTest, Selected) {
  ShuttleSearchParameters parameters = DefaultShuttleSearchParameters();
  parameters.add_ruin_operators(RuinOperator::RELATED);
  parameters.add_ruin_operators(RuinOperator::RANDOM);
  EXPECT_THAT(GetRuinOperators(parameters),
              ElementsAre(RuinOperator::RELATED, RuinOperator::RANDOM));
}

TEST(GetRuinOperatorNameTest, Names) {
  EXPECT_EQ(GetRuinOperatorName(RuinOperator::RANDOM), "random");
  EXPECT_EQ(GetRuinOperatorName(RuinOperator::WORST), "worst");
  EXPECT_EQ(GetRuinOperatorName(RuinOperator::RELATED), "related");
}

}  // namespace
}  // namespace shuttle::routing
