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

#include "services/evaluation/tissue_scorer.hpp"
#include "core/logging.hpp"

#include <cmath>

namespace lesion_eval::services {

TissueScorer::Parameters
TissueScorer::Parameters::fromConfig(const core::EvaluationConfig& config) {
    Parameters params;
    params.matcher = LesionMatcher::Parameters::fromConfig(config);
    params.volumeThreshold = config.lesionVolumeThreshold;
    params.hd95Penalty = config.hd95Penalty;
    return params;
}

class TissueScorer::Impl {
public:
    Parameters params;
    LesionMatcher matcher;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const Parameters& p)
        : params(p)
        , matcher(p.matcher)
        , logger(logging::LoggerFactory::create("TissueScorer")) {}
};

TissueScorer::TissueScorer()
    : impl_(std::make_unique<Impl>(Parameters{}))
{
}

TissueScorer::TissueScorer(const Parameters& params)
    : impl_(std::make_unique<Impl>(params))
{
}

TissueScorer::~TissueScorer() = default;

TissueScorer::TissueScorer(TissueScorer&&) noexcept = default;
TissueScorer& TissueScorer::operator=(TissueScorer&&) noexcept = default;

const TissueScorer::Parameters& TissueScorer::parameters() const {
    return impl_->params;
}

std::expected<TissueResult, EvaluationError>
TissueScorer::scoreTissue(LabelVolumeType::Pointer prediction,
                          LabelVolumeType::Pointer groundTruth,
                          TissueType tissue,
                          const SpacingType& spacing) const {
    if (!impl_->params.isValid()) {
        impl_->logger->error("Invalid tissue scoring parameters");
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Invalid tissue scoring parameters"});
    }

    auto matches = impl_->matcher.matchLesions(prediction, groundTruth, tissue, spacing);
    if (!matches) {
        return std::unexpected(matches.error());
    }

    auto result = aggregate(*matches, tissue);
    impl_->logger->info("{}: GT_TP={} TP={} FP={} FN={} complete dice={}",
                        toString(tissue), result.numGtTp, result.numTp,
                        result.numFp, result.numFn, result.completeDice);
    return result;
}

TissueResult TissueScorer::aggregate(const LesionMatchResult& matches,
                                     TissueType tissue) const {
    const auto& params = impl_->params;

    TissueResult result;
    result.tissue = tissue;
    result.numGtTp = matches.truePositiveGt.size();
    result.numTp = matches.truePositivePredicted.size();
    result.numFp = matches.falsePositivePredicted.size();
    result.numFn = matches.falseNegativeGt.size();
    result.sensitivity = matches.sensitivity;
    result.specificity = matches.specificity;
    result.completeDice = matches.completeDice;
    result.gtCompleteVolume = matches.gtCompleteVolume;
    result.predCompleteVolume = matches.predCompleteVolume;

    result.lesionRecords = matches.records;
    for (auto& record : result.lesionRecords) {
        if (std::isinf(record.hd95)) {
            record.hd95 = params.hd95Penalty;
        }
    }

    double diceSum = 0.0;
    double hd95Sum = 0.0;
    size_t scored = 0;
    for (const auto& record : result.lesionRecords) {
        if (record.gtLesionVolume > params.volumeThreshold) {
            diceSum += record.dice;
            hd95Sum += record.hd95;
            ++scored;
        }
    }

    const size_t denominator = scored + result.numFp;
    if (denominator == 0) {
        impl_->logger->debug("{}: no scored lesions and no false positives",
                             toString(tissue));
        return result;
    }

    const double fpPenalty = static_cast<double>(result.numFp) * params.hd95Penalty;
    result.lesionWiseDice = diceSum / static_cast<double>(denominator);
    result.lesionWiseHd95 = (hd95Sum + fpPenalty) / static_cast<double>(denominator);
    return result;
}

}  // namespace lesion_eval::services
