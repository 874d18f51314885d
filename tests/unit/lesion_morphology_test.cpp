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

#include "services/evaluation/lesion_morphology.hpp"
#include "services/evaluation/similarity_metrics.hpp"

#include "../test_utils/lesion_phantom_generator.hpp"

using namespace lesion_eval::services;
namespace phantom = lesion_eval::test_utils;

namespace {

BinaryMaskType::Pointer singleVoxelMask(int x, int y, int z, int size = 9) {
    auto mask = phantom::createEmptyVolume(size, size, size);
    phantom::setVoxel(mask, x, y, z, 1);
    return mask;
}

}  // anonymous namespace

// =============================================================================
// Connected component labeling
// =============================================================================

TEST(LesionMorphologyTest, SeparatedBoxesAreDistinctComponents) {
    auto mask = phantom::createEmptyVolume(16, 16, 16);
    phantom::fillBox(mask, {{1, 1, 1}, {3, 3, 3}}, 1);
    phantom::fillBox(mask, {{8, 8, 8}, {10, 10, 10}}, 1);

    auto labeling = LesionMorphology::labelComponents(mask);
    ASSERT_TRUE(labeling.has_value());
    EXPECT_EQ(labeling->componentCount, 2u);
    EXPECT_EQ(LesionMorphology::maxComponentId(labeling->components), 2u);
}

TEST(LesionMorphologyTest, CornerTouchingVoxelsDependOnConnectivity) {
    auto mask = phantom::createEmptyVolume(6, 6, 6);
    phantom::setVoxel(mask, 1, 1, 1, 1);
    phantom::setVoxel(mask, 2, 2, 2, 1);

    auto full = LesionMorphology::labelComponents(mask, true);
    auto face = LesionMorphology::labelComponents(mask, false);
    ASSERT_TRUE(full && face);
    EXPECT_EQ(full->componentCount, 1u);
    EXPECT_EQ(face->componentCount, 2u);
}

TEST(LesionMorphologyTest, EmptyMaskHasNoComponents) {
    auto mask = phantom::createEmptyVolume(5, 5, 5);

    auto labeling = LesionMorphology::labelComponents(mask);
    ASSERT_TRUE(labeling.has_value());
    EXPECT_EQ(labeling->componentCount, 0u);
    EXPECT_EQ(LesionMorphology::maxComponentId(labeling->components), 0u);
}

TEST(LesionMorphologyTest, LabelNullMaskFails) {
    auto labeling = LesionMorphology::labelComponents(nullptr);
    ASSERT_FALSE(labeling.has_value());
    EXPECT_EQ(labeling.error().code, EvaluationError::Code::InvalidInput);
}

// =============================================================================
// Dilation
// =============================================================================

TEST(LesionMorphologyTest, DilationReachFollowsConnectivityOrder) {
    auto mask = singleVoxelMask(4, 4, 4);

    auto faces = LesionMorphology::dilate(mask, 1, 1);
    auto edges = LesionMorphology::dilate(mask, 2, 1);
    auto corners = LesionMorphology::dilate(mask, 3, 1);
    ASSERT_TRUE(faces && edges && corners);

    EXPECT_EQ(SimilarityMetrics::countForeground(*faces), 7);
    EXPECT_EQ(SimilarityMetrics::countForeground(*edges), 19);
    EXPECT_EQ(SimilarityMetrics::countForeground(*corners), 27);
}

TEST(LesionMorphologyTest, DefaultDilationIsEighteenNeighborhood) {
    auto dilated = LesionMorphology::dilate(singleVoxelMask(4, 4, 4));
    ASSERT_TRUE(dilated.has_value());

    EXPECT_EQ(SimilarityMetrics::countForeground(*dilated), 19);
    EXPECT_EQ(phantom::getVoxel(*dilated, 5, 5, 4), 1);
    EXPECT_EQ(phantom::getVoxel(*dilated, 5, 5, 5), 0);
}

TEST(LesionMorphologyTest, RepeatedDilationGrowsCityBlockBall) {
    auto dilated = LesionMorphology::dilate(singleVoxelMask(4, 4, 4), 1, 2);
    ASSERT_TRUE(dilated.has_value());
    EXPECT_EQ(SimilarityMetrics::countForeground(*dilated), 25);
}

TEST(LesionMorphologyTest, DilationTreatsOutsideAsBackground) {
    auto dilated = LesionMorphology::dilate(singleVoxelMask(0, 0, 0), 3, 1);
    ASSERT_TRUE(dilated.has_value());
    EXPECT_EQ(SimilarityMetrics::countForeground(*dilated), 8);
}

TEST(LesionMorphologyTest, DilationDoesNotModifyInput) {
    auto mask = singleVoxelMask(4, 4, 4);

    auto dilated = LesionMorphology::dilate(mask);
    ASSERT_TRUE(dilated.has_value());
    EXPECT_EQ(SimilarityMetrics::countForeground(mask), 1);
}

TEST(LesionMorphologyTest, DilationRejectsInvalidParameters) {
    auto mask = singleVoxelMask(4, 4, 4);

    auto badOrder = LesionMorphology::dilate(mask, 0, 1);
    ASSERT_FALSE(badOrder.has_value());
    EXPECT_EQ(badOrder.error().code, EvaluationError::Code::InvalidParameters);

    auto tooLarge = LesionMorphology::dilate(mask, 4, 1);
    ASSERT_FALSE(tooLarge.has_value());
    EXPECT_EQ(tooLarge.error().code, EvaluationError::Code::InvalidParameters);

    auto noPasses = LesionMorphology::dilate(mask, 2, 0);
    ASSERT_FALSE(noPasses.has_value());
    EXPECT_EQ(noPasses.error().code, EvaluationError::Code::InvalidParameters);
}
