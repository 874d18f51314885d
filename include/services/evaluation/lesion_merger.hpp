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

#include <itkImage.h>

#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Merge ground-truth lesions that fuse under dilation
 *
 * Ground-truth fragments separated by thin gaps become one connected
 * component once the mask is dilated. For each dilated component c, every
 * original ground-truth voxel inside c is relabeled to c:
 *
 *   merged = c if dilated == c && original != 0, else 0
 *
 * Every original voxel must lie inside a dilated component and every
 * original lesion inside exactly one of them; dilation is extensive and
 * connectivity-preserving, so a violation means the two maps were built
 * with incompatible primitives and yields ProcessingFailed.
 */
class LesionMerger {
public:
    /**
     * @brief Project dilated component ids onto the undilated lesions
     *
     * @param dilatedComponents Component map of the dilated ground truth
     * @param originalComponents Component map of the original ground truth
     * @return Merged lesion map with ids taken from the dilated map, or error
     */
    [[nodiscard]] static std::expected<ComponentMapType::Pointer, EvaluationError>
    mergeGroundTruth(ComponentMapType::Pointer dilatedComponents,
                     ComponentMapType::Pointer originalComponents);
};

}  // namespace lesion_eval::services
