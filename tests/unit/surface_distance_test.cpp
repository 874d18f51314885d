// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <numeric>

#include "services/evaluation/surface_distance.hpp"
#include "services/evaluation/similarity_metrics.hpp"

#include "../test_utils/lesion_phantom_generator.hpp"

using namespace lesion_eval::services;
namespace phantom = lesion_eval::test_utils;

class SurfaceDistanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        cube_ = phantom::createEmptyVolume(12, 12, 12);
        phantom::fillBox(cube_, {{2, 2, 2}, {4, 4, 4}}, 1);

        shifted_ = phantom::createEmptyVolume(12, 12, 12);
        phantom::fillBox(shifted_, {{3, 2, 2}, {5, 4, 4}}, 1);

        empty_ = phantom::createEmptyVolume(12, 12, 12);
    }

    BinaryMaskType::Pointer cube_;
    BinaryMaskType::Pointer shifted_;
    BinaryMaskType::Pointer empty_;
    SpacingType unitSpacing_ = {1.0, 1.0, 1.0};
};

// =============================================================================
// Surface extraction
// =============================================================================

TEST_F(SurfaceDistanceTest, CubeSurfaceExcludesInterior) {
    auto surface = SurfaceDistance::extractSurface(cube_);
    EXPECT_EQ(SimilarityMetrics::countForeground(surface), 26);
    EXPECT_EQ(phantom::getVoxel(surface, 3, 3, 3), 0);
}

TEST_F(SurfaceDistanceTest, ImageEdgeCountsAsBackground) {
    auto full = phantom::createEmptyVolume(3, 3, 3);
    phantom::fillBox(full, {{0, 0, 0}, {2, 2, 2}}, 1);

    auto surface = SurfaceDistance::extractSurface(full);
    EXPECT_EQ(SimilarityMetrics::countForeground(surface), 26);
}

// =============================================================================
// Distances
// =============================================================================

TEST_F(SurfaceDistanceTest, IdenticalMasksHaveZeroDistance) {
    auto distances = SurfaceDistance::compute(cube_, cube_, unitSpacing_);
    ASSERT_TRUE(distances.has_value());

    EXPECT_EQ(distances->distancesAToB.size(), 26u);
    EXPECT_EQ(distances->distancesBToA.size(), 26u);
    EXPECT_DOUBLE_EQ(distances->distancesAToB.back(), 0.0);
    EXPECT_DOUBLE_EQ(SurfaceDistance::robustHausdorff(*distances), 0.0);
}

TEST_F(SurfaceDistanceTest, SingleVoxelDistance) {
    auto a = phantom::createEmptyVolume(12, 12, 12);
    auto b = phantom::createEmptyVolume(12, 12, 12);
    phantom::setVoxel(a, 2, 5, 5, 1);
    phantom::setVoxel(b, 6, 5, 5, 1);

    auto distances = SurfaceDistance::compute(a, b, unitSpacing_);
    ASSERT_TRUE(distances.has_value());
    EXPECT_NEAR(SurfaceDistance::robustHausdorff(*distances), 4.0, 1e-5);
}

TEST_F(SurfaceDistanceTest, DistanceUsesPhysicalSpacing) {
    auto a = phantom::createEmptyVolume(12, 12, 12);
    auto b = phantom::createEmptyVolume(12, 12, 12);
    phantom::setVoxel(a, 2, 5, 5, 1);
    phantom::setVoxel(b, 6, 5, 5, 1);

    auto distances = SurfaceDistance::compute(a, b, {2.0, 1.0, 1.0});
    ASSERT_TRUE(distances.has_value());
    EXPECT_NEAR(SurfaceDistance::robustHausdorff(*distances), 8.0, 1e-5);
}

TEST_F(SurfaceDistanceTest, ShiftedCubeHausdorff) {
    auto distances = SurfaceDistance::compute(cube_, shifted_, unitSpacing_);
    ASSERT_TRUE(distances.has_value());

    // The x=2 face and the face center at x=4 (interior to the shifted cube)
    // are one voxel away; every other surface voxel is shared
    const auto& aToB = distances->distancesAToB;
    ASSERT_EQ(aToB.size(), 26u);
    EXPECT_EQ(std::count_if(aToB.begin(), aToB.end(),
                            [](double d) { return std::abs(d - 1.0) < 1e-5; }), 10);
    EXPECT_NEAR(SurfaceDistance::robustHausdorff(*distances), 1.0, 1e-5);
}

TEST_F(SurfaceDistanceTest, EmptyTargetGivesInfinity) {
    auto distances = SurfaceDistance::compute(cube_, empty_, unitSpacing_);
    ASSERT_TRUE(distances.has_value());

    EXPECT_EQ(distances->distancesAToB.size(), 26u);
    EXPECT_TRUE(std::isinf(distances->distancesAToB.front()));
    EXPECT_TRUE(distances->distancesBToA.empty());
    EXPECT_TRUE(std::isinf(SurfaceDistance::robustHausdorff(*distances)));
}

TEST_F(SurfaceDistanceTest, EmptySourceGivesInfinity) {
    auto distances = SurfaceDistance::compute(empty_, cube_, unitSpacing_);
    ASSERT_TRUE(distances.has_value());

    EXPECT_TRUE(distances->distancesAToB.empty());
    EXPECT_TRUE(std::isinf(SurfaceDistance::robustHausdorff(*distances)));
}

TEST_F(SurfaceDistanceTest, BothEmptyGivesInfinity) {
    auto distances = SurfaceDistance::compute(empty_, empty_, unitSpacing_);
    ASSERT_TRUE(distances.has_value());
    EXPECT_TRUE(std::isinf(SurfaceDistance::robustHausdorff(*distances)));
}

TEST_F(SurfaceDistanceTest, ShapeMismatch) {
    auto other = phantom::createEmptyVolume(12, 12, 13);

    auto distances = SurfaceDistance::compute(cube_, other, unitSpacing_);
    ASSERT_FALSE(distances.has_value());
    EXPECT_EQ(distances.error().code, EvaluationError::Code::ShapeMismatch);
}

TEST_F(SurfaceDistanceTest, NonPositiveSpacingRejected) {
    auto distances = SurfaceDistance::compute(cube_, shifted_, {1.0, 0.0, 1.0});
    ASSERT_FALSE(distances.has_value());
    EXPECT_EQ(distances.error().code, EvaluationError::Code::InvalidParameters);
}

// =============================================================================
// Percentile selection
// =============================================================================

TEST(RobustHausdorffTest, PercentileIndexSelection) {
    SurfaceDistances distances;
    distances.distancesAToB.resize(20);
    std::iota(distances.distancesAToB.begin(), distances.distancesAToB.end(), 0.0);
    distances.distancesBToA = {5.0};

    EXPECT_DOUBLE_EQ(SurfaceDistance::robustHausdorff(distances, 95.0), 18.0);
    EXPECT_DOUBLE_EQ(SurfaceDistance::robustHausdorff(distances, 100.0), 19.0);
    EXPECT_DOUBLE_EQ(SurfaceDistance::robustHausdorff(distances, 50.0), 9.0);
}

TEST(RobustHausdorffTest, MaximumOfBothDirections) {
    SurfaceDistances distances;
    distances.distancesAToB = {0.0, 1.0};
    distances.distancesBToA = {0.0, 7.0};

    EXPECT_DOUBLE_EQ(SurfaceDistance::robustHausdorff(distances), 7.0);
}
