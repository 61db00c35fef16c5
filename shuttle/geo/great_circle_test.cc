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

#include "shuttle/geo/great_circle.h"

#include <cmath>

#include "gtest/gtest.h"

namespace shuttle::geo {
namespace {

TEST(GreatCircleDistanceKmTest, SamePointIsZero) {
  EXPECT_DOUBLE_EQ(GreatCircleDistanceKm(31.5, 74.3, 31.5, 74.3), 0.0);
}

TEST(GreatCircleDistanceKmTest, OneDegreeOfLatitude) {
  EXPECT_NEAR(GreatCircleDistanceKm(0, 0, 1, 0), kEarthRadiusKm * M_PI / 180,
              1e-9);
  EXPECT_NEAR(GreatCircleDistanceKm(0, 0, 0, 1), kEarthRadiusKm * M_PI / 180,
              1e-9);
}

TEST(GreatCircleDistanceKmTest, IsSymmetric) {
  EXPECT_DOUBLE_EQ(GreatCircleDistanceKm(31.52, 74.35, 24.86, 67.01),
                   GreatCircleDistanceKm(24.86, 67.01, 31.52, 74.35));
}

TEST(GreatCircleDistanceKmTest, ParisLondon) {
  EXPECT_NEAR(GreatCircleDistanceKm(48.8566, 2.3522, 51.5074, -0.1278), 343.5,
              1.0);
}

TEST(GreatCircleDistanceKmTest, AntipodesAreHalfACircumference) {
  EXPECT_NEAR(GreatCircleDistanceKm(0, 0, 0, 180), kEarthRadiusKm * M_PI,
              1e-6);
}

TEST(TravelMinutesTest, ConstantSpeed) {
  EXPECT_DOUBLE_EQ(TravelMinutes(40, 40), 60);
  EXPECT_DOUBLE_EQ(TravelMinutes(10, 60), 10);
  EXPECT_DOUBLE_EQ(TravelMinutes(0, 40), 0);
}

}  // namespace
}  // namespace shuttle::geo
