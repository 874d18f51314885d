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

/**
 * @file evaluation_types.hpp
 * @brief Error codes, image types and result structures for lesion-wise evaluation
 * @details Defines the tissue taxonomy (WT, TC, ET), the ITK image types
 *          used for label volumes, binary masks and component maps, and the
 *          per-lesion and per-tissue result records produced by the
 *          evaluation pipeline.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <itkImage.h>

namespace lesion_eval::services {

/**
 * @brief Error information for evaluation operations
 */
struct EvaluationError {
    enum class Code {
        Success,
        InvalidInput,
        ShapeMismatch,
        InvalidParameters,
        ProcessingFailed,
        IoFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::ShapeMismatch: return "Shape mismatch: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::IoFailed: return "I/O failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/// Multi-class segmentation volume with labels {0,1,2,3}
using LabelVolumeType = itk::Image<uint8_t, 3>;

/// 0/1 foreground mask
using BinaryMaskType = itk::Image<uint8_t, 3>;

/// Lesion identifier; 0 is background
using LesionId = uint32_t;

/// Connected component map, one positive id per lesion
using ComponentMapType = itk::Image<LesionId, 3>;

/// Physical voxel spacing [x, y, z]
using SpacingType = std::array<double, 3>;

/**
 * @brief A label volume together with its physical voxel spacing
 */
struct LabelVolume {
    LabelVolumeType::Pointer labels;
    SpacingType spacing = {1.0, 1.0, 1.0};
};

/**
 * @brief Nested tumor sub-regions scored by the evaluation
 *
 * | Tissue | Foreground labels |
 * |--------|-------------------|
 * | WT     | 1, 2, 3           |
 * | TC     | 1, 3              |
 * | ET     | 3                 |
 */
enum class TissueType {
    WT,  ///< Whole tumor
    TC,  ///< Tumor core
    ET   ///< Enhancing tumor
};

/// Report row order
inline constexpr std::array<TissueType, 3> kTissueOrder = {
    TissueType::WT, TissueType::TC, TissueType::ET
};

[[nodiscard]] inline std::string toString(TissueType tissue) {
    switch (tissue) {
        case TissueType::WT: return "WT";
        case TissueType::TC: return "TC";
        case TissueType::ET: return "ET";
    }
    return "Unknown";
}

/**
 * @brief Metrics for one merged ground-truth lesion
 */
struct MatchRecord {
    /// Predicted components overlapping the lesion, ascending
    std::vector<LesionId> predictedLesionIds;

    LesionId gtLesionId = 0;

    /// Physical volume of the ground-truth lesion
    double gtLesionVolume = 0.0;

    double dice = 0.0;

    /// +infinity until the scorer substitutes the penalty
    double hd95 = 0.0;

    /**
     * @brief Get header row of the lesion detail table
     */
    [[nodiscard]] static std::vector<std::string> getCsvHeader();

    /**
     * @brief Get data row of the lesion detail table
     * @param tissue Tissue type the lesion belongs to
     * @return Values as strings; predicted ids rendered as "[1 2]"
     */
    [[nodiscard]] std::vector<std::string> getCsvRow(TissueType tissue) const;
};

/**
 * @brief Output of lesion matching for one tissue type
 */
struct LesionMatchResult {
    /// Predicted ids credited as true positives; one entry per (GT lesion, predicted id) pair
    std::vector<LesionId> truePositivePredicted;

    /// Merged GT lesions without any overlapping predicted voxel
    std::vector<LesionId> falseNegativeGt;

    /// Predicted components that overlap no merged GT lesion
    std::set<LesionId> falsePositivePredicted;

    /// Merged GT lesions with at least one overlapping predicted voxel
    std::vector<LesionId> truePositiveGt;

    /// Ordered by ascending GT lesion id
    std::vector<MatchRecord> records;

    /// NaN when both masks are empty
    double completeDice = 0.0;

    double gtCompleteVolume = 0.0;
    double predCompleteVolume = 0.0;
    double sensitivity = 0.0;
    double specificity = 0.0;
};

/**
 * @brief Aggregated scores for one tissue type
 */
struct TissueResult {
    TissueType tissue = TissueType::WT;

    size_t numGtTp = 0;
    size_t numTp = 0;
    size_t numFp = 0;
    size_t numFn = 0;

    double sensitivity = 0.0;
    double specificity = 0.0;

    /// NaN when both masks are empty
    double completeDice = 0.0;

    double gtCompleteVolume = 0.0;
    double predCompleteVolume = 0.0;

    /// Missing when there is neither a scored lesion nor a false positive
    std::optional<double> lesionWiseDice;
    std::optional<double> lesionWiseHd95;

    /// Per-lesion records with infinite HD95 already replaced by the penalty
    std::vector<MatchRecord> lesionRecords;

    /**
     * @brief Get header row for CSV export
     * @return Column names in report order
     */
    [[nodiscard]] static std::vector<std::string> getCsvHeader();

    /**
     * @brief Get data row for CSV export
     * @return Values as strings; NaN and missing values are empty
     */
    [[nodiscard]] std::vector<std::string> getCsvRow() const;
};

/**
 * @brief Per-tissue results of one case, in WT, TC, ET order
 */
struct EvaluationReport {
    std::vector<TissueResult> rows;

    /**
     * @brief Find the row of a tissue type
     * @return Pointer into rows, or nullptr if absent
     */
    [[nodiscard]] const TissueResult* find(TissueType tissue) const;

    /**
     * @brief Generate formatted table string
     */
    [[nodiscard]] std::string toString() const;
};

}  // namespace lesion_eval::services
