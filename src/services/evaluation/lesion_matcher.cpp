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

#include "services/evaluation/lesion_matcher.hpp"
#include "services/evaluation/lesion_merger.hpp"
#include "services/evaluation/lesion_morphology.hpp"
#include "services/evaluation/similarity_metrics.hpp"
#include "services/evaluation/surface_distance.hpp"
#include "services/evaluation/tissue_masker.hpp"
#include "services/evaluation/volume_geometry.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <set>
#include <vector>

namespace lesion_eval::services {

namespace {

/**
 * @brief Linear voxel offsets of every component id, indexed by id
 */
std::vector<std::vector<size_t>> collectComponentVoxels(ComponentMapType::Pointer components,
                                                        LesionId maxId) {
    std::vector<std::vector<size_t>> voxels(static_cast<size_t>(maxId) + 1);
    const auto* buf = components->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(components.GetPointer());
    for (size_t i = 0; i < totalVoxels; ++i) {
        if (buf[i] != 0) {
            voxels[buf[i]].push_back(i);
        }
    }
    return voxels;
}

BinaryMaskType::Pointer maskFromVoxels(const BinaryMaskType* reference,
                                       const std::vector<size_t>& voxels) {
    auto mask = geometry::allocateLike<BinaryMaskType>(reference);
    auto* buf = mask->GetBufferPointer();
    for (size_t offset : voxels) {
        buf[offset] = 1;
    }
    return mask;
}

}  // anonymous namespace

// =============================================================================
// LesionMatcher::Parameters
// =============================================================================

LesionMatcher::Parameters
LesionMatcher::Parameters::fromConfig(const core::EvaluationConfig& config) {
    Parameters params;
    params.dilationIterations = config.dilationIterations;
    params.dilationConnectivity = config.dilationConnectivity;
    params.fullyConnected = config.fullyConnectedComponents;
    params.hausdorffPercentile = config.hausdorffPercentile;
    params.epsilon = config.epsilon;
    return params;
}

// =============================================================================
// LesionMatcher::Impl
// =============================================================================

class LesionMatcher::Impl {
public:
    Parameters params;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const Parameters& p)
        : params(p)
        , logger(logging::LoggerFactory::create("LesionMatcher")) {}

    std::expected<LesionMatchResult, EvaluationError>
    match(LabelVolumeType::Pointer prediction,
          LabelVolumeType::Pointer groundTruth,
          TissueType tissue,
          const SpacingType& spacing) const;

    std::expected<void, EvaluationError>
    computeWholeVolumeMetrics(const TissueMasker::MaskPair& masks,
                              double voxelVolume,
                              LesionMatchResult& result) const;

    std::expected<ComponentMapType::Pointer, EvaluationError>
    mergedGroundTruthLesions(BinaryMaskType::Pointer gtMask,
                             ComponentMapType::Pointer gtComponents) const;
};

std::expected<void, EvaluationError>
LesionMatcher::Impl::computeWholeVolumeMetrics(const TissueMasker::MaskPair& masks,
                                               double voxelVolume,
                                               LesionMatchResult& result) const {
    auto dice = SimilarityMetrics::dice(masks.prediction, masks.groundTruth);
    if (!dice) {
        return std::unexpected(dice.error());
    }
    result.completeDice = *dice;

    auto stats = SimilarityMetrics::sensitivitySpecificity(
        masks.prediction, masks.groundTruth, params.epsilon);
    if (!stats) {
        return std::unexpected(stats.error());
    }
    result.sensitivity = stats->sensitivity;
    result.specificity = stats->specificity;

    result.gtCompleteVolume =
        static_cast<double>(SimilarityMetrics::countForeground(masks.groundTruth)) * voxelVolume;
    result.predCompleteVolume =
        static_cast<double>(SimilarityMetrics::countForeground(masks.prediction)) * voxelVolume;

    return {};
}

std::expected<ComponentMapType::Pointer, EvaluationError>
LesionMatcher::Impl::mergedGroundTruthLesions(BinaryMaskType::Pointer gtMask,
                                              ComponentMapType::Pointer gtComponents) const {
    auto dilated = LesionMorphology::dilate(
        gtMask, params.dilationConnectivity, params.dilationIterations);
    if (!dilated) {
        return std::unexpected(dilated.error());
    }

    auto dilatedLabeling = LesionMorphology::labelComponents(*dilated, params.fullyConnected);
    if (!dilatedLabeling) {
        return std::unexpected(dilatedLabeling.error());
    }

    return LesionMerger::mergeGroundTruth(dilatedLabeling->components, gtComponents);
}

std::expected<LesionMatchResult, EvaluationError>
LesionMatcher::Impl::match(LabelVolumeType::Pointer prediction,
                           LabelVolumeType::Pointer groundTruth,
                           TissueType tissue,
                           const SpacingType& spacing) const {
    const auto tissueName = toString(tissue);

    if (!params.isValid()) {
        logger->error("Invalid lesion matching parameters");
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Invalid lesion matching parameters"});
    }

    if (spacing[0] <= 0 || spacing[1] <= 0 || spacing[2] <= 0) {
        logger->error("Invalid spacing values");
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Spacing values must be positive"});
    }

    auto masks = TissueMasker::mask(prediction, groundTruth, tissue);
    if (!masks) {
        logger->error("{}: {}", tissueName, masks.error().toString());
        return std::unexpected(masks.error());
    }
    geometry::applySpacing(masks->prediction.GetPointer(), spacing);
    geometry::applySpacing(masks->groundTruth.GetPointer(), spacing);

    const double voxelVolume = spacing[0] * spacing[1] * spacing[2];

    LesionMatchResult result;
    if (auto wholeVolume = computeWholeVolumeMetrics(*masks, voxelVolume, result); !wholeVolume) {
        logger->error("{}: {}", tissueName, wholeVolume.error().toString());
        return std::unexpected(wholeVolume.error());
    }

    auto gtLabeling = LesionMorphology::labelComponents(masks->groundTruth, params.fullyConnected);
    if (!gtLabeling) {
        logger->error("{}: {}", tissueName, gtLabeling.error().toString());
        return std::unexpected(gtLabeling.error());
    }

    auto predLabeling = LesionMorphology::labelComponents(masks->prediction, params.fullyConnected);
    if (!predLabeling) {
        logger->error("{}: {}", tissueName, predLabeling.error().toString());
        return std::unexpected(predLabeling.error());
    }

    auto merged = mergedGroundTruthLesions(masks->groundTruth, gtLabeling->components);
    if (!merged) {
        logger->error("{}: {}", tissueName, merged.error().toString());
        return std::unexpected(merged.error());
    }

    const LesionId mergedCount = LesionMorphology::maxComponentId(*merged);
    logger->debug("{}: {} GT components merged into {} lesions, {} predicted components",
                  tissueName, gtLabeling->componentCount, mergedCount,
                  predLabeling->componentCount);

    const auto gtLesionVoxels = collectComponentVoxels(*merged, mergedCount);
    const auto predComponentVoxels =
        collectComponentVoxels(predLabeling->components, predLabeling->componentCount);
    const auto* predBuf = predLabeling->components->GetBufferPointer();
    const auto* reference = masks->groundTruth.GetPointer();

    for (LesionId gtId = 1; gtId <= mergedCount; ++gtId) {
        const auto& lesionVoxels = gtLesionVoxels[gtId];
        if (lesionVoxels.empty()) {
            // Only reachable when dilation reach exceeds component connectivity
            logger->debug("{}: merged lesion {} has no voxels, skipped", tissueName, gtId);
            continue;
        }

        MatchRecord record;
        record.gtLesionId = gtId;
        record.gtLesionVolume = static_cast<double>(lesionVoxels.size()) * voxelVolume;

        std::set<LesionId> intersecting;
        for (size_t offset : lesionVoxels) {
            if (predBuf[offset] != 0) {
                intersecting.insert(predBuf[offset]);
            }
        }
        record.predictedLesionIds.assign(intersecting.begin(), intersecting.end());
        result.truePositivePredicted.insert(result.truePositivePredicted.end(),
                                            intersecting.begin(), intersecting.end());

        std::vector<size_t> isolatedVoxels;
        for (LesionId predId : intersecting) {
            const auto& voxels = predComponentVoxels[predId];
            isolatedVoxels.insert(isolatedVoxels.end(), voxels.begin(), voxels.end());
        }

        auto gtLesionMask = maskFromVoxels(reference, lesionVoxels);
        auto isolatedPredMask = maskFromVoxels(reference, isolatedVoxels);

        auto dice = SimilarityMetrics::dice(isolatedPredMask, gtLesionMask);
        if (!dice) {
            logger->error("{}: lesion {}: {}", tissueName, gtId, dice.error().toString());
            return std::unexpected(dice.error());
        }
        record.dice = *dice;

        auto distances = SurfaceDistance::compute(gtLesionMask, isolatedPredMask, spacing);
        if (!distances) {
            logger->error("{}: lesion {}: {}", tissueName, gtId, distances.error().toString());
            return std::unexpected(distances.error());
        }
        record.hd95 = SurfaceDistance::robustHausdorff(*distances, params.hausdorffPercentile);

        if (intersecting.empty()) {
            result.falseNegativeGt.push_back(gtId);
        } else {
            result.truePositiveGt.push_back(gtId);
        }

        logger->debug("{}: lesion {} volume={} predicted={} dice={} hd95={}",
                      tissueName, gtId, record.gtLesionVolume,
                      record.predictedLesionIds.size(), record.dice, record.hd95);

        result.records.push_back(std::move(record));
    }

    const std::set<LesionId> credited(result.truePositivePredicted.begin(),
                                      result.truePositivePredicted.end());
    for (LesionId predId = 1; predId <= predLabeling->componentCount; ++predId) {
        if (!predComponentVoxels[predId].empty() && !credited.contains(predId)) {
            result.falsePositivePredicted.insert(predId);
        }
    }

    logger->debug("{}: GT_TP={} TP={} FP={} FN={}", tissueName,
                  result.truePositiveGt.size(), result.truePositivePredicted.size(),
                  result.falsePositivePredicted.size(), result.falseNegativeGt.size());

    return result;
}

// =============================================================================
// LesionMatcher implementation
// =============================================================================

LesionMatcher::LesionMatcher()
    : impl_(std::make_unique<Impl>(Parameters{}))
{
}

LesionMatcher::LesionMatcher(const Parameters& params)
    : impl_(std::make_unique<Impl>(params))
{
}

LesionMatcher::~LesionMatcher() = default;

LesionMatcher::LesionMatcher(LesionMatcher&&) noexcept = default;
LesionMatcher& LesionMatcher::operator=(LesionMatcher&&) noexcept = default;

const LesionMatcher::Parameters& LesionMatcher::parameters() const {
    return impl_->params;
}

std::expected<LesionMatchResult, EvaluationError>
LesionMatcher::matchLesions(LabelVolumeType::Pointer prediction,
                            LabelVolumeType::Pointer groundTruth,
                            TissueType tissue,
                            const SpacingType& spacing) const {
    return impl_->match(prediction, groundTruth, tissue, spacing);
}

}  // namespace lesion_eval::services
