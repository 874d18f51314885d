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
 * @file lesion_matcher.hpp
 * @brief Lesion-level matching of predicted components to ground-truth lesions
 * @details Splits the tissue masks of a prediction and a ground truth into
 *          connected lesions, merges ground-truth fragments that touch after
 *          dilation, and matches every merged ground-truth lesion against the
 *          predicted components that overlap it. Produces the detection
 *          classification (TP/FP/FN) together with per-lesion Dice and HD95.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <memory>

#include <itkImage.h>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Match predicted lesions against merged ground-truth lesions
 *
 * Matching procedure for one tissue type:
 * 1. Mask prediction and ground truth for the tissue
 * 2. Whole-volume Dice, sensitivity, specificity and physical volumes
 * 3. Label both masks into connected components
 * 4. Dilate the ground truth, label it, and merge ground-truth lesions
 *    falling into the same dilated component
 * 5. For every merged ground-truth lesion, collect the overlapping
 *    predicted components and score them together against the lesion
 * 6. Predicted components overlapping no lesion are false positives
 *
 * A predicted component overlapping several merged lesions is credited as
 * a true positive once per lesion and is never a false positive.
 *
 * @example
 * @code
 * LesionMatcher matcher;
 * auto result = matcher.matchLesions(prediction, groundTruth,
 *                                    TissueType::ET, {1.0, 1.0, 1.0});
 * if (result) {
 *     for (const auto& record : result->records) {
 *         std::cout << record.gtLesionId << ": " << record.dice << std::endl;
 *     }
 * }
 * @endcode
 */
class LesionMatcher {
public:
    /**
     * @brief Parameters of lesion identification and distance measurement
     */
    struct Parameters {
        /// Dilation passes before merging ground-truth lesions
        int dilationIterations = core::evaluation_constants::kDilationIterations;

        /// Dilation structuring element reach (1-3)
        int dilationConnectivity = core::evaluation_constants::kDilationConnectivity;

        /// 26-neighborhood lesions when true, 6-neighborhood otherwise
        bool fullyConnected = true;

        /// Hausdorff percentile (0-100]
        double hausdorffPercentile = core::evaluation_constants::kHausdorffPercentile;

        /// Sensitivity/specificity denominator guard
        double epsilon = core::evaluation_constants::kEpsilon;

        [[nodiscard]] bool isValid() const noexcept {
            return dilationIterations >= 1
                && dilationConnectivity >= 1 && dilationConnectivity <= 3
                && hausdorffPercentile > 0.0 && hausdorffPercentile <= 100.0
                && epsilon > 0.0;
        }

        [[nodiscard]] static Parameters fromConfig(const core::EvaluationConfig& config);
    };

    LesionMatcher();
    explicit LesionMatcher(const Parameters& params);
    ~LesionMatcher();

    // Non-copyable, movable
    LesionMatcher(const LesionMatcher&) = delete;
    LesionMatcher& operator=(const LesionMatcher&) = delete;
    LesionMatcher(LesionMatcher&&) noexcept;
    LesionMatcher& operator=(LesionMatcher&&) noexcept;

    [[nodiscard]] const Parameters& parameters() const;

    /**
     * @brief Match lesions of one tissue type
     *
     * @param prediction Predicted label volume
     * @param groundTruth Ground-truth label volume
     * @param tissue Tissue type to evaluate
     * @param spacing Physical voxel spacing shared by both volumes
     * @return Detection classification and per-lesion records, or error
     *         (ShapeMismatch if the volumes differ in size)
     */
    [[nodiscard]] std::expected<LesionMatchResult, EvaluationError>
    matchLesions(LabelVolumeType::Pointer prediction,
                 LabelVolumeType::Pointer groundTruth,
                 TissueType tissue,
                 const SpacingType& spacing) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lesion_eval::services
