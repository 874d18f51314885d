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
 * @file volume_geometry.hpp
 * @brief Geometry helpers shared by the evaluation services
 * @details Allocation of images that mirror another image's grid, size
 *          comparison and voxel counting over the linear pixel buffer.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/evaluation/evaluation_types.hpp"

#include <expected>
#include <format>
#include <string>

#include <itkImage.h>

namespace lesion_eval::services::geometry {

/**
 * @brief Create a zero-filled image with the same region, spacing, origin
 *        and direction as the source
 */
template <typename TOutput, typename TSource>
typename TOutput::Pointer allocateLike(const TSource* source) {
    auto output = TOutput::New();
    output->SetRegions(source->GetLargestPossibleRegion());
    output->SetSpacing(source->GetSpacing());
    output->SetOrigin(source->GetOrigin());
    output->SetDirection(source->GetDirection());
    output->Allocate(true);
    return output;
}

template <typename TImage>
size_t voxelCount(const TImage* image) {
    auto size = image->GetLargestPossibleRegion().GetSize();
    return static_cast<size_t>(size[0]) * size[1] * size[2];
}

template <typename TImageA, typename TImageB>
bool sameSize(const TImageA* a, const TImageB* b) {
    return a->GetLargestPossibleRegion().GetSize() == b->GetLargestPossibleRegion().GetSize();
}

template <typename TImage>
std::string describeSize(const TImage* image) {
    auto size = image->GetLargestPossibleRegion().GetSize();
    return std::format("{}x{}x{}", size[0], size[1], size[2]);
}

/**
 * @brief Validate that two images are non-null and share their size
 * @return Empty on success, InvalidInput or ShapeMismatch otherwise
 */
template <typename TImageA, typename TImageB>
std::expected<void, EvaluationError> validateSameShape(const TImageA* a, const TImageB* b) {
    if (!a || !b) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Null image pointer"});
    }
    if (!sameSize(a, b)) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::ShapeMismatch,
            std::format("A={} vs B={}", describeSize(a), describeSize(b))});
    }
    return {};
}

/**
 * @brief Assign physical spacing to an image
 */
template <typename TImage>
void applySpacing(TImage* image, const SpacingType& spacing) {
    typename TImage::SpacingType itkSpacing;
    itkSpacing[0] = spacing[0];
    itkSpacing[1] = spacing[1];
    itkSpacing[2] = spacing[2];
    image->SetSpacing(itkSpacing);
}

}  // namespace lesion_eval::services::geometry
