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

#include "services/evaluation/case_evaluator.hpp"
#include "services/evaluation/report_assembler.hpp"
#include "services/evaluation/volume_geometry.hpp"
#include "services/export/evaluation_report_writer.hpp"
#include "services/io/label_volume_loader.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <format>

namespace lesion_eval::services {

namespace {

constexpr double kSpacingTolerance = 1e-6;

std::string caseStem(const std::filesystem::path& predictionPath) {
    auto name = predictionPath.filename().string();
    return name.substr(0, name.find('.'));
}

bool sameSpacing(const SpacingType& a, const SpacingType& b) {
    for (size_t i = 0; i < 3; ++i) {
        if (std::abs(a[i] - b[i]) > kSpacingTolerance) {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

class CaseEvaluator::Impl {
public:
    core::EvaluationConfig config;
    LabelVolumeLoader loader;
    ReportAssembler assembler;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const core::EvaluationConfig& c)
        : config(c)
        , assembler(c)
        , logger(logging::LoggerFactory::create("CaseEvaluator")) {}
};

CaseEvaluator::CaseEvaluator()
    : impl_(std::make_unique<Impl>(core::EvaluationConfig{}))
{
}

CaseEvaluator::CaseEvaluator(const core::EvaluationConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

CaseEvaluator::~CaseEvaluator() = default;

CaseEvaluator::CaseEvaluator(CaseEvaluator&&) noexcept = default;
CaseEvaluator& CaseEvaluator::operator=(CaseEvaluator&&) noexcept = default;

const core::EvaluationConfig& CaseEvaluator::config() const {
    return impl_->config;
}

std::filesystem::path
CaseEvaluator::resultsPathFor(const std::filesystem::path& predictionPath) {
    return predictionPath.parent_path() / (caseStem(predictionPath) + "_results.csv");
}

std::filesystem::path
CaseEvaluator::lesionDetailsPathFor(const std::filesystem::path& predictionPath) {
    return predictionPath.parent_path()
        / (caseStem(predictionPath) + "_lesionwise_metrics.csv");
}

std::expected<EvaluationReport, EvaluationError>
CaseEvaluator::evaluate(const std::filesystem::path& predictionPath,
                        const std::filesystem::path& groundTruthPath) const {
    auto prediction = impl_->loader.load(predictionPath);
    if (!prediction) {
        return std::unexpected(prediction.error());
    }

    auto groundTruth = impl_->loader.load(groundTruthPath);
    if (!groundTruth) {
        return std::unexpected(groundTruth.error());
    }

    if (auto shape = geometry::validateSameShape(prediction->labels.GetPointer(),
                                                 groundTruth->labels.GetPointer());
        !shape) {
        impl_->logger->error("{}", shape.error().toString());
        return std::unexpected(shape.error());
    }

    if (!sameSpacing(prediction->spacing, groundTruth->spacing)) {
        auto message = std::format(
            "Spacing differs: prediction={}x{}x{} ground truth={}x{}x{}",
            prediction->spacing[0], prediction->spacing[1], prediction->spacing[2],
            groundTruth->spacing[0], groundTruth->spacing[1], groundTruth->spacing[2]);
        impl_->logger->error("{}", message);
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput, message});
    }

    impl_->logger->info("Evaluating {} against {}",
                        predictionPath.string(), groundTruthPath.string());

    return impl_->assembler.assemble(prediction->labels, groundTruth->labels,
                                     prediction->spacing);
}

std::expected<CaseOutputs, EvaluationError>
CaseEvaluator::run(const std::filesystem::path& predictionPath,
                   const std::filesystem::path& groundTruthPath,
                   const std::optional<std::filesystem::path>& outputPath) const {
    auto report = evaluate(predictionPath, groundTruthPath);
    if (!report) {
        return std::unexpected(report.error());
    }

    CaseOutputs outputs;
    outputs.report = std::move(*report);
    outputs.resultsPath = outputPath.value_or(resultsPathFor(predictionPath));

    if (auto written = EvaluationReportWriter::writeResults(outputs.report, outputs.resultsPath);
        !written) {
        impl_->logger->error("{}", written.error().toString());
        return std::unexpected(written.error());
    }
    impl_->logger->info("Results written to {}", outputs.resultsPath.string());

    if (impl_->config.writeLesionDetails) {
        auto detailsPath = lesionDetailsPathFor(predictionPath);
        if (auto written = EvaluationReportWriter::writeLesionDetails(outputs.report, detailsPath);
            !written) {
            impl_->logger->error("{}", written.error().toString());
            return std::unexpected(written.error());
        }
        impl_->logger->info("Lesion details written to {}", detailsPath.string());
        outputs.lesionDetailsPath = detailsPath;
    }

    return outputs;
}

}  // namespace lesion_eval::services
