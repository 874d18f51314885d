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

#include "services/evaluation/similarity_metrics.hpp"
#include "services/evaluation/volume_geometry.hpp"

#include <limits>

namespace lesion_eval::services {

int64_t SimilarityMetrics::countForeground(BinaryMaskType::Pointer mask) {
    if (!mask) {
        return 0;
    }
    const auto* buf = mask->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(mask.GetPointer());
    int64_t count = 0;
    for (size_t i = 0; i < totalVoxels; ++i) {
        if (buf[i] != 0) ++count;
    }
    return count;
}

std::expected<double, EvaluationError>
SimilarityMetrics::dice(BinaryMaskType::Pointer maskA, BinaryMaskType::Pointer maskB) {
    auto validation = geometry::validateSameShape(maskA.GetPointer(), maskB.GetPointer());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    const auto* bufA = maskA->GetBufferPointer();
    const auto* bufB = maskB->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(maskA.GetPointer());

    int64_t countA = 0;
    int64_t countB = 0;
    int64_t intersection = 0;
    for (size_t i = 0; i < totalVoxels; ++i) {
        bool a = bufA[i] != 0;
        bool b = bufB[i] != 0;
        countA += a;
        countB += b;
        intersection += (a && b);
    }

    if (countA + countB == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    return 2.0 * static_cast<double>(intersection) / static_cast<double>(countA + countB);
}

std::expected<SensitivitySpecificity, EvaluationError>
SimilarityMetrics::sensitivitySpecificity(BinaryMaskType::Pointer result,
                                          BinaryMaskType::Pointer target,
                                          double epsilon) {
    auto validation = geometry::validateSameShape(result.GetPointer(), target.GetPointer());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    const auto* bufResult = result->GetBufferPointer();
    const auto* bufTarget = target->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(result.GetPointer());

    int64_t resultCount = 0;
    int64_t targetCount = 0;
    SensitivitySpecificity stats;
    for (size_t i = 0; i < totalVoxels; ++i) {
        bool r = bufResult[i] != 0;
        bool t = bufTarget[i] != 0;
        resultCount += r;
        targetCount += t;
        if (r && t) {
            ++stats.truePositives;
        } else if (!r && !t) {
            ++stats.trueNegatives;
        }
    }
    stats.falsePositives = resultCount - stats.truePositives;
    stats.falseNegatives = targetCount - stats.truePositives;

    auto tp = static_cast<double>(stats.truePositives);
    auto tn = static_cast<double>(stats.trueNegatives);
    stats.sensitivity = tp / (tp + static_cast<double>(stats.falseNegatives) + epsilon);
    stats.specificity = tn / (tn + static_cast<double>(stats.falsePositives) + epsilon);

    // Nothing to detect and nothing predicted is a perfect match
    if (resultCount == 0 && targetCount == 0) {
        stats.sensitivity = 1.0;
    }

    return stats;
}

}  // namespace lesion_eval::services
