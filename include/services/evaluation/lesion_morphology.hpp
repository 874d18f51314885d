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
 * @brief Connected components of a binary mask
 */
struct ComponentLabeling {
    /// Consecutive ids 1..componentCount, 0 = background
    ComponentMapType::Pointer components;

    LesionId componentCount = 0;
};

/**
 * @brief Lesion identification primitives on binary masks
 *
 * Wraps the ITK filters used to split a tissue mask into lesions:
 * - Connected component labeling with 6- or 26-neighborhood
 * - Binary dilation with a radius-1 structuring element whose reach is
 *   selected by city-block order (1 = faces, 2 = faces + edges,
 *   3 = faces + edges + corners)
 *
 * Voxels outside the image are background.
 *
 * @example
 * @code
 * auto dilated = LesionMorphology::dilate(gtMask, 2, 1);
 * auto labeled = LesionMorphology::labelComponents(*dilated);
 * if (labeled) {
 *     auto count = labeled->componentCount;
 * }
 * @endcode
 */
class LesionMorphology {
public:
    /**
     * @brief Label connected foreground regions
     *
     * @param mask Binary mask (nonzero = foreground)
     * @param fullyConnected true for 26-neighborhood, false for 6-neighborhood
     * @return Component map with consecutive ids, or error
     */
    [[nodiscard]] static std::expected<ComponentLabeling, EvaluationError>
    labelComponents(BinaryMaskType::Pointer mask, bool fullyConnected = true);

    /**
     * @brief Binary dilation with a radius-1 structuring element
     *
     * @param mask Binary mask (foreground = 1)
     * @param connectivityOrder Structuring element reach (1-3)
     * @param iterations Number of dilation passes (>= 1)
     * @return Dilated mask, InvalidParameters on out-of-range arguments
     */
    [[nodiscard]] static std::expected<BinaryMaskType::Pointer, EvaluationError>
    dilate(BinaryMaskType::Pointer mask, int connectivityOrder = 2, int iterations = 1);

    /**
     * @brief Largest id present in a component map
     */
    [[nodiscard]] static LesionId maxComponentId(ComponentMapType::Pointer components);
};

}  // namespace lesion_eval::services
