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

#pragma once

#include <expected>
#include <memory>

#include <itkImage.h>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"
#include "services/evaluation/lesion_matcher.hpp"

namespace lesion_eval::services {

/**
 * @brief Aggregate lesion matches of one tissue type into a report row
 *
 * Runs LesionMatcher, replaces infinite HD95 values with the penalty and
 * aggregates the lesions whose volume exceeds the threshold:
 *
 *   lesionWiseDice = Σ dice / (n + FP)
 *   lesionWiseHd95 = (Σ hd95 + FP · penalty) / (n + FP)
 *
 * Both scores are missing when n + FP is zero. Lesions at or below the
 * threshold still count toward the detection counts.
 */
class TissueScorer {
public:
    struct Parameters {
        LesionMatcher::Parameters matcher;

        /// Lesions with volume <= threshold are excluded from aggregation
        double volumeThreshold = core::evaluation_constants::kLesionVolumeThreshold;

        /// Substitute for infinite HD95 and per-false-positive distance
        double hd95Penalty = core::evaluation_constants::kHd95Penalty;

        [[nodiscard]] bool isValid() const noexcept {
            return matcher.isValid() && volumeThreshold >= 0.0 && hd95Penalty > 0.0;
        }

        [[nodiscard]] static Parameters fromConfig(const core::EvaluationConfig& config);
    };

    TissueScorer();
    explicit TissueScorer(const Parameters& params);
    ~TissueScorer();

    TissueScorer(const TissueScorer&) = delete;
    TissueScorer& operator=(const TissueScorer&) = delete;
    TissueScorer(TissueScorer&&) noexcept;
    TissueScorer& operator=(TissueScorer&&) noexcept;

    [[nodiscard]] const Parameters& parameters() const;

    /**
     * @brief Score one tissue type
     *
     * @return Report row labeled with the tissue type, or the matching error
     */
    [[nodiscard]] std::expected<TissueResult, EvaluationError>
    scoreTissue(LabelVolumeType::Pointer prediction,
                LabelVolumeType::Pointer groundTruth,
                TissueType tissue,
                const SpacingType& spacing) const;

    /**
     * @brief Aggregate an existing match result
     *
     * Pure function of its inputs; exposed for callers that already hold
     * the lesion matches.
     */
    [[nodiscard]] TissueResult aggregate(const LesionMatchResult& matches,
                                         TissueType tissue) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lesion_eval::services
