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
#include <vector>

#include <itkImage.h>

#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Derive per-tissue binary masks from multi-class label volumes
 *
 * For each voxel:
 *   mask = 1 if label is in the tissue's foreground set, else 0
 *
 * Prediction and ground truth are transformed independently into NEW
 * masks; the input volumes are never modified. Labels outside {1,2,3}
 * are background for every tissue type.
 */
class TissueMasker {
public:
    /**
     * @brief Masks derived from one prediction/ground-truth pair
     */
    struct MaskPair {
        BinaryMaskType::Pointer prediction;
        BinaryMaskType::Pointer groundTruth;
    };

    /**
     * @brief Mask both volumes for one tissue type
     *
     * @param prediction Predicted label volume
     * @param groundTruth Ground-truth label volume
     * @param tissue Tissue type selecting the foreground labels
     * @return Independent prediction and ground-truth masks, ShapeMismatch
     *         if the volumes differ in size
     */
    [[nodiscard]] static std::expected<MaskPair, EvaluationError>
    mask(LabelVolumeType::Pointer prediction,
         LabelVolumeType::Pointer groundTruth,
         TissueType tissue);

    /**
     * @brief Mask a single volume for one tissue type
     */
    [[nodiscard]] static std::expected<BinaryMaskType::Pointer, EvaluationError>
    extract(LabelVolumeType::Pointer volume, TissueType tissue);

    [[nodiscard]] static bool isForeground(uint8_t label, TissueType tissue) noexcept;

    /**
     * @brief Foreground labels of a tissue type, ascending
     */
    [[nodiscard]] static std::vector<uint8_t> foregroundLabels(TissueType tissue);
};

}  // namespace lesion_eval::services
