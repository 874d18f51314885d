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

#include "services/evaluation/evaluation_types.hpp"

#include <cmath>
#include <format>
#include <iomanip>
#include <sstream>

namespace lesion_eval::services {

namespace {

/// Shortest round-trip form, always with a fractional part ("1.0", "0.25")
std::string formatDouble(double value) {
    if (std::isnan(value)) {
        return "";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    auto text = std::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string formatOptional(const std::optional<double>& value) {
    return value.has_value() ? formatDouble(value.value()) : "";
}

std::string formatIds(const std::vector<LesionId>& ids) {
    std::string text = "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += std::to_string(ids[i]);
    }
    text += ']';
    return text;
}

}  // anonymous namespace

// =============================================================================
// MatchRecord implementation
// =============================================================================

std::vector<std::string> MatchRecord::getCsvHeader() {
    return {
        "predicted_lesion_numbers", "gt_lesion_numbers", "gt_lesion_vol",
        "dice_lesionwise", "hd95_lesionwise", "Label"
    };
}

std::vector<std::string> MatchRecord::getCsvRow(TissueType tissue) const {
    return {
        formatIds(predictedLesionIds),
        std::to_string(gtLesionId),
        formatDouble(gtLesionVolume),
        formatDouble(dice),
        formatDouble(hd95),
        services::toString(tissue)
    };
}

// =============================================================================
// TissueResult implementation
// =============================================================================

std::vector<std::string> TissueResult::getCsvHeader() {
    return {
        "Labels", "Num_GT_TP", "Num_TP", "Num_FP", "Num_FN",
        "Sensitivity", "Specificity", "Complete_Dice", "GT_Complete_Volume",
        "LesionWise_Score_Dice", "LesionWise_Score_HD95"
    };
}

std::vector<std::string> TissueResult::getCsvRow() const {
    return {
        services::toString(tissue),
        std::to_string(numGtTp),
        std::to_string(numTp),
        std::to_string(numFp),
        std::to_string(numFn),
        formatDouble(sensitivity),
        formatDouble(specificity),
        formatDouble(completeDice),
        formatDouble(gtCompleteVolume),
        formatOptional(lesionWiseDice),
        formatOptional(lesionWiseHd95)
    };
}

// =============================================================================
// EvaluationReport implementation
// =============================================================================

const TissueResult* EvaluationReport::find(TissueType tissue) const {
    for (const auto& row : rows) {
        if (row.tissue == tissue) {
            return &row;
        }
    }
    return nullptr;
}

std::string EvaluationReport::toString() const {
    std::ostringstream oss;
    oss << "Lesion-wise Evaluation\n";
    oss << "==============================================================\n";
    oss << std::left << std::setw(8) << "Label"
        << std::right << std::setw(6) << "GT_TP"
        << std::setw(6) << "TP"
        << std::setw(6) << "FP"
        << std::setw(6) << "FN"
        << std::setw(10) << "Dice"
        << std::setw(10) << "LW_Dice"
        << std::setw(10) << "LW_HD95" << "\n";
    oss << "--------------------------------------------------------------\n";

    oss << std::fixed << std::setprecision(4);
    for (const auto& row : rows) {
        oss << std::left << std::setw(8) << services::toString(row.tissue)
            << std::right << std::setw(6) << row.numGtTp
            << std::setw(6) << row.numTp
            << std::setw(6) << row.numFp
            << std::setw(6) << row.numFn;

        if (std::isnan(row.completeDice)) {
            oss << std::setw(10) << "nan";
        } else {
            oss << std::setw(10) << row.completeDice;
        }
        if (row.lesionWiseDice) {
            oss << std::setw(10) << *row.lesionWiseDice;
        } else {
            oss << std::setw(10) << "nan";
        }
        if (row.lesionWiseHd95) {
            oss << std::setw(10) << *row.lesionWiseHd95;
        } else {
            oss << std::setw(10) << "nan";
        }
        oss << "\n";
    }

    return oss.str();
}

}  // namespace lesion_eval::services
