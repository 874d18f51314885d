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

#include "services/evaluation/tissue_masker.hpp"
#include "services/evaluation/volume_geometry.hpp"

namespace lesion_eval::services {

bool TissueMasker::isForeground(uint8_t label, TissueType tissue) noexcept {
    switch (tissue) {
        case TissueType::WT: return label == 1 || label == 2 || label == 3;
        case TissueType::TC: return label == 1 || label == 3;
        case TissueType::ET: return label == 3;
    }
    return false;
}

std::vector<uint8_t> TissueMasker::foregroundLabels(TissueType tissue) {
    std::vector<uint8_t> labels;
    for (uint8_t label = 1; label <= 3; ++label) {
        if (isForeground(label, tissue)) {
            labels.push_back(label);
        }
    }
    return labels;
}

std::expected<BinaryMaskType::Pointer, EvaluationError>
TissueMasker::extract(LabelVolumeType::Pointer volume, TissueType tissue) {
    if (!volume) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Label volume is null"});
    }

    auto output = geometry::allocateLike<BinaryMaskType>(volume.GetPointer());
    const auto* bufIn = volume->GetBufferPointer();
    auto* bufOut = output->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(volume.GetPointer());

    for (size_t i = 0; i < totalVoxels; ++i) {
        bufOut[i] = isForeground(bufIn[i], tissue) ? 1 : 0;
    }

    return output;
}

std::expected<TissueMasker::MaskPair, EvaluationError>
TissueMasker::mask(LabelVolumeType::Pointer prediction,
                   LabelVolumeType::Pointer groundTruth,
                   TissueType tissue) {
    auto validation = geometry::validateSameShape(prediction.GetPointer(),
                                                  groundTruth.GetPointer());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    auto predMask = extract(prediction, tissue);
    if (!predMask) {
        return std::unexpected(predMask.error());
    }

    auto gtMask = extract(groundTruth, tissue);
    if (!gtMask) {
        return std::unexpected(gtMask.error());
    }

    return MaskPair{*predMask, *gtMask};
}

}  // namespace lesion_eval::services
