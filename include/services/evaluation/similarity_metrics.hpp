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

#include <cstdint>
#include <expected>

#include <itkImage.h>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Voxel-wise overlap statistics between two binary masks
 */
struct SensitivitySpecificity {
    double sensitivity = 0.0;
    double specificity = 0.0;

    int64_t truePositives = 0;
    int64_t falsePositives = 0;
    int64_t falseNegatives = 0;
    int64_t trueNegatives = 0;
};

/**
 * @brief Stateless overlap metrics on binary masks
 *
 * Any nonzero voxel counts as foreground. Both masks must have the same
 * size; spacing is irrelevant for these voxel-count ratios.
 */
class SimilarityMetrics {
public:
    /**
     * @brief Dice coefficient 2|A∩B| / (|A|+|B|)
     *
     * @return Dice in [0,1], quiet NaN when both masks are empty,
     *         ShapeMismatch if sizes differ
     */
    [[nodiscard]] static std::expected<double, EvaluationError>
    dice(BinaryMaskType::Pointer maskA, BinaryMaskType::Pointer maskB);

    /**
     * @brief Sensitivity TP/(TP+FN+ε) and specificity TN/(TN+FP+ε)
     *
     * Sensitivity is forced to 1.0 when both masks are empty.
     *
     * @param result Predicted mask
     * @param target Reference mask
     * @param epsilon Denominator guard
     */
    [[nodiscard]] static std::expected<SensitivitySpecificity, EvaluationError>
    sensitivitySpecificity(BinaryMaskType::Pointer result,
                           BinaryMaskType::Pointer target,
                           double epsilon = core::evaluation_constants::kEpsilon);

    /**
     * @brief Number of nonzero voxels
     */
    [[nodiscard]] static int64_t countForeground(BinaryMaskType::Pointer mask);
};

}  // namespace lesion_eval::services
