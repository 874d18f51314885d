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

#include "services/evaluation/evaluation_types.hpp"

using namespace lesion_eval::services;

// =============================================================================
// EvaluationError
// =============================================================================

TEST(EvaluationErrorTest, DefaultIsSuccess) {
    EvaluationError error;
    EXPECT_TRUE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Success");
}

TEST(EvaluationErrorTest, ToStringIncludesCategoryAndMessage) {
    EvaluationError error{EvaluationError::Code::ShapeMismatch, "A=1x1x1 vs B=2x2x2"};
    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Shape mismatch: A=1x1x1 vs B=2x2x2");
}

TEST(TissueTypeTest, ToString) {
    EXPECT_EQ(toString(TissueType::WT), "WT");
    EXPECT_EQ(toString(TissueType::TC), "TC");
    EXPECT_EQ(toString(TissueType::ET), "ET");
    EXPECT_EQ(kTissueOrder[0], TissueType::WT);
    EXPECT_EQ(kTissueOrder[2], TissueType::ET);
}

// =============================================================================
// Results table rows
// =============================================================================

TEST(TissueResultTest, CsvHeaderColumnOrder) {
    auto header = TissueResult::getCsvHeader();
    std::vector<std::string> expected = {
        "Labels", "Num_GT_TP", "Num_TP", "Num_FP", "Num_FN",
        "Sensitivity", "Specificity", "Complete_Dice", "GT_Complete_Volume",
        "LesionWise_Score_Dice", "LesionWise_Score_HD95"
    };
    EXPECT_EQ(header, expected);
}

TEST(TissueResultTest, CsvRowFormatting) {
    TissueResult result;
    result.tissue = TissueType::TC;
    result.numGtTp = 2;
    result.numTp = 3;
    result.numFp = 1;
    result.numFn = 0;
    result.sensitivity = 1.0;
    result.specificity = 0.25;
    result.completeDice = 0.5;
    result.gtCompleteVolume = 27.0;
    result.lesionWiseDice = 0.75;
    result.lesionWiseHd95 = 374.0;

    auto row = result.getCsvRow();
    ASSERT_EQ(row.size(), TissueResult::getCsvHeader().size());
    EXPECT_EQ(row[0], "TC");
    EXPECT_EQ(row[1], "2");
    EXPECT_EQ(row[2], "3");
    EXPECT_EQ(row[3], "1");
    EXPECT_EQ(row[4], "0");
    EXPECT_EQ(row[5], "1.0");
    EXPECT_EQ(row[6], "0.25");
    EXPECT_EQ(row[7], "0.5");
    EXPECT_EQ(row[8], "27.0");
    EXPECT_EQ(row[9], "0.75");
    EXPECT_EQ(row[10], "374.0");
}

TEST(TissueResultTest, MissingValuesAreEmptyCells) {
    TissueResult result;
    result.completeDice = std::numeric_limits<double>::quiet_NaN();

    auto row = result.getCsvRow();
    EXPECT_EQ(row[7], "");
    EXPECT_EQ(row[9], "");
    EXPECT_EQ(row[10], "");
}

// =============================================================================
// Lesion detail rows
// =============================================================================

TEST(MatchRecordTest, CsvRowFormatting) {
    MatchRecord record;
    record.predictedLesionIds = {1, 4};
    record.gtLesionId = 2;
    record.gtLesionVolume = 54.0;
    record.dice = 0.5;
    record.hd95 = 374.0;

    auto row = record.getCsvRow(TissueType::ET);
    ASSERT_EQ(row.size(), MatchRecord::getCsvHeader().size());
    EXPECT_EQ(row[0], "[1 4]");
    EXPECT_EQ(row[1], "2");
    EXPECT_EQ(row[2], "54.0");
    EXPECT_EQ(row[3], "0.5");
    EXPECT_EQ(row[4], "374.0");
    EXPECT_EQ(row[5], "ET");
}

TEST(MatchRecordTest, NoPredictedLesions) {
    MatchRecord record;
    auto row = record.getCsvRow(TissueType::WT);
    EXPECT_EQ(row[0], "[]");
}

// =============================================================================
// Report
// =============================================================================

TEST(EvaluationReportTest, FindByTissue) {
    EvaluationReport report;
    TissueResult wt;
    wt.tissue = TissueType::WT;
    wt.numFp = 4;
    report.rows.push_back(wt);

    ASSERT_NE(report.find(TissueType::WT), nullptr);
    EXPECT_EQ(report.find(TissueType::WT)->numFp, 4u);
    EXPECT_EQ(report.find(TissueType::ET), nullptr);
}

TEST(EvaluationReportTest, ToStringShowsMissingValuesAsNan) {
    EvaluationReport report;
    TissueResult et;
    et.tissue = TissueType::ET;
    et.completeDice = std::numeric_limits<double>::quiet_NaN();
    report.rows.push_back(et);

    auto text = report.toString();
    EXPECT_NE(text.find("ET"), std::string::npos);
    EXPECT_NE(text.find("nan"), std::string::npos);
}
