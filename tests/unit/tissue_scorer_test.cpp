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

#include <limits>

#include "services/evaluation/tissue_scorer.hpp"

#include "../test_utils/lesion_phantom_generator.hpp"

using namespace lesion_eval::services;
namespace phantom = lesion_eval::test_utils;

namespace {

MatchRecord makeRecord(LesionId gtId, double volume, double dice, double hd95,
                       std::vector<LesionId> predicted = {}) {
    MatchRecord record;
    record.gtLesionId = gtId;
    record.gtLesionVolume = volume;
    record.dice = dice;
    record.hd95 = hd95;
    record.predictedLesionIds = std::move(predicted);
    return record;
}

}  // anonymous namespace

class TissueScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        prediction_ = phantom::createEmptyVolume(24, 24, 24);
        groundTruth_ = phantom::createEmptyVolume(24, 24, 24);
    }

    std::expected<TissueResult, EvaluationError> score(TissueType tissue) {
        return scorer_.scoreTissue(prediction_, groundTruth_, tissue, {1.0, 1.0, 1.0});
    }

    TissueScorer scorer_;
    LabelVolumeType::Pointer prediction_;
    LabelVolumeType::Pointer groundTruth_;
};

// =============================================================================
// Aggregation
// =============================================================================

TEST_F(TissueScorerTest, AggregateAppliesThresholdAndPenalty) {
    LesionMatchResult matches;
    matches.records.push_back(makeRecord(1, 27.0, 0.8, 2.0, {1}));
    matches.records.push_back(makeRecord(2, 3.0, 0.1, 100.0, {2}));
    matches.records.push_back(makeRecord(3, 30.0, 0.0,
                                         std::numeric_limits<double>::infinity()));
    matches.truePositiveGt = {1, 2};
    matches.truePositivePredicted = {1, 2};
    matches.falseNegativeGt = {3};
    matches.falsePositivePredicted = {4};

    auto result = scorer_.aggregate(matches, TissueType::TC);

    EXPECT_EQ(result.tissue, TissueType::TC);
    EXPECT_EQ(result.numGtTp, 2u);
    EXPECT_EQ(result.numTp, 2u);
    EXPECT_EQ(result.numFn, 1u);
    EXPECT_EQ(result.numFp, 1u);

    ASSERT_TRUE(result.lesionWiseDice.has_value());
    ASSERT_TRUE(result.lesionWiseHd95.has_value());
    EXPECT_DOUBLE_EQ(*result.lesionWiseDice, 0.8 / 3.0);
    EXPECT_DOUBLE_EQ(*result.lesionWiseHd95, (2.0 + 374.0 + 374.0) / 3.0);

    ASSERT_EQ(result.lesionRecords.size(), 3u);
    EXPECT_DOUBLE_EQ(result.lesionRecords[2].hd95, 374.0);
    EXPECT_DOUBLE_EQ(result.lesionRecords[1].hd95, 100.0);
}

TEST_F(TissueScorerTest, AggregateWithZeroDenominatorIsMissing) {
    LesionMatchResult matches;
    matches.records.push_back(makeRecord(1, 4.0, 1.0, 0.0, {1}));
    matches.truePositiveGt = {1};
    matches.truePositivePredicted = {1};

    auto result = scorer_.aggregate(matches, TissueType::WT);

    EXPECT_EQ(result.numGtTp, 1u);
    EXPECT_FALSE(result.lesionWiseDice.has_value());
    EXPECT_FALSE(result.lesionWiseHd95.has_value());
}

TEST_F(TissueScorerTest, AggregateCarriesWholeVolumeMetrics) {
    LesionMatchResult matches;
    matches.completeDice = 0.75;
    matches.sensitivity = 0.6;
    matches.specificity = 0.99;
    matches.gtCompleteVolume = 120.0;
    matches.predCompleteVolume = 80.0;

    auto result = scorer_.aggregate(matches, TissueType::ET);

    EXPECT_DOUBLE_EQ(result.completeDice, 0.75);
    EXPECT_DOUBLE_EQ(result.sensitivity, 0.6);
    EXPECT_DOUBLE_EQ(result.specificity, 0.99);
    EXPECT_DOUBLE_EQ(result.gtCompleteVolume, 120.0);
    EXPECT_DOUBLE_EQ(result.predCompleteVolume, 80.0);
}

TEST_F(TissueScorerTest, CustomPenaltyAndThreshold) {
    TissueScorer::Parameters params;
    params.volumeThreshold = 0.0;
    params.hd95Penalty = 100.0;
    TissueScorer scorer(params);

    LesionMatchResult matches;
    matches.records.push_back(makeRecord(1, 1.0, 0.5,
                                         std::numeric_limits<double>::infinity(), {1}));
    matches.truePositiveGt = {1};
    matches.truePositivePredicted = {1};

    auto result = scorer.aggregate(matches, TissueType::WT);
    ASSERT_TRUE(result.lesionWiseDice && result.lesionWiseHd95);
    EXPECT_DOUBLE_EQ(*result.lesionWiseDice, 0.5);
    EXPECT_DOUBLE_EQ(*result.lesionWiseHd95, 100.0);
}

// =============================================================================
// Scoring label volumes
// =============================================================================

TEST_F(TissueScorerTest, PerfectMatch) {
    phantom::fillBox(prediction_, {{5, 5, 5}, {7, 7, 7}}, 3);
    phantom::fillBox(groundTruth_, {{5, 5, 5}, {7, 7, 7}}, 3);

    auto result = score(TissueType::ET);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->numGtTp, 1u);
    EXPECT_EQ(result->numTp, 1u);
    EXPECT_EQ(result->numFp, 0u);
    EXPECT_EQ(result->numFn, 0u);
    EXPECT_DOUBLE_EQ(result->completeDice, 1.0);
    ASSERT_TRUE(result->lesionWiseDice && result->lesionWiseHd95);
    EXPECT_DOUBLE_EQ(*result->lesionWiseDice, 1.0);
    EXPECT_NEAR(*result->lesionWiseHd95, 0.0, 1e-6);
}

TEST_F(TissueScorerTest, SmallLesionCountedButNotScored) {
    phantom::setVoxel(prediction_, 10, 10, 10, 3);
    phantom::setVoxel(groundTruth_, 10, 10, 10, 3);

    auto result = score(TissueType::ET);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->numGtTp, 1u);
    EXPECT_EQ(result->numFn, 0u);
    EXPECT_FALSE(result->lesionWiseDice.has_value());
    EXPECT_FALSE(result->lesionWiseHd95.has_value());
}

TEST_F(TissueScorerTest, LesionAtThresholdIsExcluded) {
    // 5 voxels at 1mm^3: volume equals the threshold
    phantom::fillBox(groundTruth_, {{4, 4, 4}, {8, 4, 4}}, 3);

    auto result = score(TissueType::ET);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->numFn, 1u);
    EXPECT_FALSE(result->lesionWiseDice.has_value());
}

TEST_F(TissueScorerTest, SmallMissedLesionStillCountsAsFalseNegative) {
    phantom::setVoxel(groundTruth_, 3, 3, 3, 1);
    phantom::fillBox(groundTruth_, {{12, 12, 12}, {14, 14, 14}}, 1);
    phantom::fillBox(prediction_, {{12, 12, 12}, {14, 14, 14}}, 1);

    auto result = score(TissueType::TC);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->numGtTp, 1u);
    EXPECT_EQ(result->numFn, 1u);
    ASSERT_TRUE(result->lesionWiseDice.has_value());
    EXPECT_DOUBLE_EQ(*result->lesionWiseDice, 1.0);
}

TEST_F(TissueScorerTest, MissedLesionGetsPenaltyDistance) {
    phantom::fillBox(groundTruth_, {{5, 5, 5}, {7, 7, 7}}, 2);

    auto result = score(TissueType::WT);
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->lesionRecords.size(), 1u);
    EXPECT_DOUBLE_EQ(result->lesionRecords[0].hd95, 374.0);
    ASSERT_TRUE(result->lesionWiseDice && result->lesionWiseHd95);
    EXPECT_DOUBLE_EQ(*result->lesionWiseDice, 0.0);
    EXPECT_DOUBLE_EQ(*result->lesionWiseHd95, 374.0);
}

TEST_F(TissueScorerTest, FalsePositiveOnlyIsFullyPenalized) {
    phantom::fillBox(prediction_, {{5, 5, 5}, {7, 7, 7}}, 2);

    auto result = score(TissueType::WT);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->numFp, 1u);
    EXPECT_EQ(result->numGtTp, 0u);
    EXPECT_DOUBLE_EQ(result->sensitivity, 0.0);
    ASSERT_TRUE(result->lesionWiseDice && result->lesionWiseHd95);
    EXPECT_DOUBLE_EQ(*result->lesionWiseDice, 0.0);
    EXPECT_DOUBLE_EQ(*result->lesionWiseHd95, 374.0);
}

TEST_F(TissueScorerTest, EmptyTissueKeepsBothSignals) {
    auto result = score(TissueType::ET);
    ASSERT_TRUE(result.has_value());

    EXPECT_DOUBLE_EQ(result->sensitivity, 1.0);
    EXPECT_FALSE(result->lesionWiseDice.has_value());
    EXPECT_FALSE(result->lesionWiseHd95.has_value());
}

TEST_F(TissueScorerTest, ShapeMismatchPropagates) {
    auto other = phantom::createEmptyVolume(20, 24, 24);

    auto result = scorer_.scoreTissue(prediction_, other, TissueType::WT, {1.0, 1.0, 1.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvaluationError::Code::ShapeMismatch);
}

TEST(TissueScorerParametersTest, FromConfig) {
    lesion_eval::core::EvaluationConfig config;
    config.lesionVolumeThreshold = 10.0;
    config.hd95Penalty = 200.0;
    config.dilationIterations = 2;

    auto params = TissueScorer::Parameters::fromConfig(config);
    EXPECT_DOUBLE_EQ(params.volumeThreshold, 10.0);
    EXPECT_DOUBLE_EQ(params.hd95Penalty, 200.0);
    EXPECT_EQ(params.matcher.dilationIterations, 2);
    EXPECT_TRUE(params.isValid());

    params.hd95Penalty = 0.0;
    EXPECT_FALSE(params.isValid());
}
