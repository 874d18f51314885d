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

#include "services/evaluation/report_assembler.hpp"
#include "core/logging.hpp"

#include <vector>

namespace lesion_eval::services {

class ReportAssembler::Impl {
public:
    TissueScorer scorer;
    bool parallel = false;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const core::EvaluationConfig& config)
        : scorer(TissueScorer::Parameters::fromConfig(config))
        , parallel(config.parallelTissues)
        , logger(logging::LoggerFactory::create("ReportAssembler")) {}

    std::expected<EvaluationReport, EvaluationError>
    assembleSequential(LabelVolumeType::Pointer prediction,
                       LabelVolumeType::Pointer groundTruth,
                       const SpacingType& spacing) const {
        EvaluationReport report;
        for (TissueType tissue : kTissueOrder) {
            auto row = scorer.scoreTissue(prediction, groundTruth, tissue, spacing);
            if (!row) {
                logger->error("{} evaluation failed: {}", toString(tissue),
                              row.error().toString());
                return std::unexpected(row.error());
            }
            report.rows.push_back(std::move(*row));
        }
        return report;
    }

    std::expected<EvaluationReport, EvaluationError>
    assembleParallel(LabelVolumeType::Pointer prediction,
                     LabelVolumeType::Pointer groundTruth,
                     const SpacingType& spacing) const {
        std::vector<std::future<std::expected<TissueResult, EvaluationError>>> pending;
        pending.reserve(kTissueOrder.size());
        for (TissueType tissue : kTissueOrder) {
            pending.push_back(std::async(std::launch::async,
                [this, prediction, groundTruth, tissue, spacing]() {
                    return scorer.scoreTissue(prediction, groundTruth, tissue, spacing);
                }));
        }

        // Collect every future before reporting so no task outlives the call
        std::vector<std::expected<TissueResult, EvaluationError>> rows;
        rows.reserve(pending.size());
        for (auto& future : pending) {
            rows.push_back(future.get());
        }

        EvaluationReport report;
        for (size_t i = 0; i < rows.size(); ++i) {
            if (!rows[i]) {
                logger->error("{} evaluation failed: {}", toString(kTissueOrder[i]),
                              rows[i].error().toString());
                return std::unexpected(rows[i].error());
            }
            report.rows.push_back(std::move(*rows[i]));
        }
        return report;
    }
};

ReportAssembler::ReportAssembler()
    : impl_(std::make_unique<Impl>(core::EvaluationConfig{}))
{
}

ReportAssembler::ReportAssembler(const core::EvaluationConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

ReportAssembler::~ReportAssembler() = default;

ReportAssembler::ReportAssembler(ReportAssembler&&) noexcept = default;
ReportAssembler& ReportAssembler::operator=(ReportAssembler&&) noexcept = default;

bool ReportAssembler::isParallel() const noexcept {
    return impl_->parallel;
}

void ReportAssembler::setParallel(bool parallel) noexcept {
    impl_->parallel = parallel;
}

std::expected<EvaluationReport, EvaluationError>
ReportAssembler::assemble(LabelVolumeType::Pointer prediction,
                          LabelVolumeType::Pointer groundTruth,
                          const SpacingType& spacing) const {
    if (!prediction || !groundTruth) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Prediction or ground truth volume is null"});
    }

    impl_->logger->debug("Assembling report ({})",
                         impl_->parallel ? "parallel" : "sequential");

    if (impl_->parallel) {
        return impl_->assembleParallel(prediction, groundTruth, spacing);
    }
    return impl_->assembleSequential(prediction, groundTruth, spacing);
}

std::future<std::expected<EvaluationReport, EvaluationError>>
ReportAssembler::assembleAsync(LabelVolumeType::Pointer prediction,
                               LabelVolumeType::Pointer groundTruth,
                               const SpacingType& spacing) const {
    return std::async(std::launch::async,
        [this, prediction, groundTruth, spacing]() {
            return assemble(prediction, groundTruth, spacing);
        });
}

}  // namespace lesion_eval::services
