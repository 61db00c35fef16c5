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

#include "shuttle/routing/consolidation.h"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/solution.h"
#include "shuttle/routing/testing/test_models.h"

namespace shuttle::routing {
namespace {

using ::shuttle::routing::test::AddPickupSpot;
using ::shuttle::routing::test::AddVehicle;
using ::shuttle::routing::test::MakeModel;
using ::shuttle::routing::test::MakePlanarProblem;
using ::testing::ElementsAre;

class ConsolidateRoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    model_ = MakeModel();
    AddVehicle("cheap", 20, 1, &model_);
    AddVehicle("expensive", 20, 5, &model_);
    AddPickupSpot("a", 3, 0, 10, &model_);
    AddPickupSpot("b", 0, 4, 5, &model_);
    problem_ = MakePlanarProblem(model_);
  }

  Solution Evaluated(Solution solution) const {
    EvaluateSolution(*problem_, &solution);
    return solution;
  }

  ShuttleRoutingModel model_;
  std::unique_ptr<Problem> problem_;
};

TEST_F(ConsolidateRoutesTest, MergesOnCheapestVehicle) {
  const Solution solution = Evaluated(Solution({{0, 0, 10}, {1, 1, 5}}));
  ASSERT_DOUBLE_EQ(solution.total_cost(), 6 + 40);
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_THAT(consolidated.assignments(),
              ElementsAre(Assignment{0, 0, 10}, Assignment{1, 0, 5}));
  EXPECT_TRUE(IsValidSolution(*problem_, consolidated));
  EXPECT_DOUBLE_EQ(consolidated.total_cost(), 12);
  EXPECT_EQ(consolidated.vehicles_used(), 1);
}

TEST_F(ConsolidateRoutesTest, MergesSplitSpot) {
  const Solution solution =
      Evaluated(Solution({{0, 1, 4}, {0, 0, 6}, {1, 0, 5}}));
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_THAT(consolidated.assignments(),
              ElementsAre(Assignment{0, 0, 10}, Assignment{1, 0, 5}));
  EXPECT_EQ(consolidated.vehicles_used(), 1);
  EXPECT_LT(consolidated.total_cost(), solution.total_cost());
}

TEST_F(ConsolidateRoutesTest, KeepsSolutionWhenNotBetter) {
  const Solution solution = Evaluated(Solution({{1, 0, 5}, {0, 0, 10}}));
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_EQ(consolidated.assignments(), solution.assignments());
  EXPECT_EQ(consolidated.total_cost(), solution.total_cost());
}

TEST_F(ConsolidateRoutesTest, KeepsSolutionWhenMoreExpensive) {
  model_.mutable_pickup_spots(0)->set_worker_count(30);
  // Consolidation would split a over both vehicles and send the expensive
  // one to b: 6 * 1 + 12 * 5 = 66.
  const Solution solution =
      Evaluated(Solution({{0, 1, 20}, {0, 0, 10}, {1, 0, 5}}));
  ASSERT_TRUE(IsValidSolution(*problem_, solution));
  ASSERT_DOUBLE_EQ(solution.total_cost(), 30 + 12);
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_EQ(consolidated.assignments(), solution.assignments());
  EXPECT_DOUBLE_EQ(consolidated.total_cost(), 42);
}

TEST_F(ConsolidateRoutesTest, KeepsInvalidSolution) {
  model_.mutable_pickup_spots(0)->set_worker_count(40);
  const Solution solution =
      Evaluated(Solution({{0, 1, 20}, {0, 0, 15}, {1, 0, 5}}));
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_EQ(consolidated.assignments(), solution.assignments());
}

TEST_F(ConsolidateRoutesTest, KeepsSolutionWhenDemandExceedsCapacity) {
  model_.mutable_pickup_spots(0)->set_worker_count(45);
  const Solution solution =
      Evaluated(Solution({{0, 0, 25}, {0, 1, 20}, {1, 1, 5}}));
  const Solution consolidated = ConsolidateRoutes(*problem_, solution);
  EXPECT_EQ(consolidated.assignments(), solution.assignments());
  EXPECT_DOUBLE_EQ(consolidated.total_cost(), solution.total_cost());
}

TEST(ConsolidateRoutesFleetTest, AcceptsFewerVehiclesAtHigherCost) {
  ShuttleRoutingModel model = MakeModel();
  AddVehicle("v0", 10, 1, &model);
  AddVehicle("v1", 10, 10, &model);
  AddVehicle("v2", 10, 11, &model);
  AddPickupSpot("near", 1, 0, 10, &model);
  AddPickupSpot("far", 0, 100, 5, &model);
  const std::unique_ptr<Problem> problem = MakePlanarProblem(model);
  Solution solution({{1, 0, 5}, {0, 1, 5}, {0, 2, 5}});
  EvaluateSolution(*problem, &solution);
  ASSERT_TRUE(IsValidSolution(*problem, solution));
  ASSERT_DOUBLE_EQ(solution.total_cost(), 200 * 1 + 2 * 10 + 2 * 11);
  ASSERT_EQ(solution.vehicles_used(), 3);

  // The near spot fills v0, so the far one moves to the pricier v1.
  const Solution consolidated = ConsolidateRoutes(*problem, solution);
  EXPECT_THAT(consolidated.assignments(),
              ElementsAre(Assignment{0, 0, 10}, Assignment{1, 1, 5}));
  EXPECT_EQ(consolidated.vehicles_used(), 2);
  EXPECT_DOUBLE_EQ(consolidated.total_cost(), 2 * 1 + 200 * 10);
}

}  // namespace
}  // namespace shuttle::routing
