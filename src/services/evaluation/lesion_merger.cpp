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

#include "services/evaluation/lesion_merger.hpp"
#include "services/evaluation/volume_geometry.hpp"

#include <format>
#include <unordered_map>

namespace lesion_eval::services {

std::expected<ComponentMapType::Pointer, EvaluationError>
LesionMerger::mergeGroundTruth(ComponentMapType::Pointer dilatedComponents,
                               ComponentMapType::Pointer originalComponents) {
    auto validation = geometry::validateSameShape(dilatedComponents.GetPointer(),
                                                  originalComponents.GetPointer());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    auto output = geometry::allocateLike<ComponentMapType>(originalComponents.GetPointer());
    const auto* bufDilated = dilatedComponents->GetBufferPointer();
    const auto* bufOriginal = originalComponents->GetBufferPointer();
    auto* bufOut = output->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(originalComponents.GetPointer());

    // original id -> dilated id it was merged into
    std::unordered_map<LesionId, LesionId> assignment;

    for (size_t i = 0; i < totalVoxels; ++i) {
        const LesionId original = bufOriginal[i];
        if (original == 0) {
            continue;
        }

        const LesionId dilated = bufDilated[i];
        if (dilated == 0) {
            return std::unexpected(EvaluationError{
                EvaluationError::Code::ProcessingFailed,
                std::format("Lesion {} is not covered by the dilated mask at voxel {}",
                            original, i)});
        }

        auto [it, inserted] = assignment.try_emplace(original, dilated);
        if (!inserted && it->second != dilated) {
            return std::unexpected(EvaluationError{
                EvaluationError::Code::ProcessingFailed,
                std::format("Lesion {} spans dilated components {} and {}",
                            original, it->second, dilated)});
        }

        bufOut[i] = dilated;
    }

    return output;
}

}  // namespace lesion_eval::services
