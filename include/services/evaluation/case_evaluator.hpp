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
 * @file case_evaluator.hpp
 * @brief End-to-end evaluation of one prediction/ground-truth file pair
 * @details Loads both label volumes, checks that they share size and
 *          spacing, assembles the WT/TC/ET report and persists it next to
 *          the prediction.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Files produced by one evaluation run
 */
struct CaseOutputs {
    EvaluationReport report;
    std::filesystem::path resultsPath;

    /// Set when the lesion detail table was written
    std::optional<std::filesystem::path> lesionDetailsPath;
};

/**
 * @brief Evaluate one case from files
 *
 * @example
 * @code
 * CaseEvaluator evaluator(config);
 * auto outputs = evaluator.run("case_001.nii.gz", "case_001_seg.nii.gz");
 * if (outputs) {
 *     std::cout << outputs->report.toString();
 * }
 * @endcode
 */
class CaseEvaluator {
public:
    CaseEvaluator();
    explicit CaseEvaluator(const core::EvaluationConfig& config);
    ~CaseEvaluator();

    CaseEvaluator(const CaseEvaluator&) = delete;
    CaseEvaluator& operator=(const CaseEvaluator&) = delete;
    CaseEvaluator(CaseEvaluator&&) noexcept;
    CaseEvaluator& operator=(CaseEvaluator&&) noexcept;

    [[nodiscard]] const core::EvaluationConfig& config() const;

    /**
     * @brief Load both volumes and assemble the report
     *
     * The prediction's spacing is used for every physical measurement.
     *
     * @return Report, ShapeMismatch if sizes differ, InvalidInput if
     *         spacings differ, IoFailed if a file cannot be read
     */
    [[nodiscard]] std::expected<EvaluationReport, EvaluationError>
    evaluate(const std::filesystem::path& predictionPath,
             const std::filesystem::path& groundTruthPath) const;

    /**
     * @brief Evaluate and write the results table
     *
     * @param outputPath Results table path; defaults to resultsPathFor()
     * @return Report and written paths, or the first error
     */
    [[nodiscard]] std::expected<CaseOutputs, EvaluationError>
    run(const std::filesystem::path& predictionPath,
        const std::filesystem::path& groundTruthPath,
        const std::optional<std::filesystem::path>& outputPath = std::nullopt) const;

    /**
     * @brief Default results path: <dir>/<name up to first '.'>_results.csv
     */
    [[nodiscard]] static std::filesystem::path
    resultsPathFor(const std::filesystem::path& predictionPath);

    /**
     * @brief Default detail path: <dir>/<name up to first '.'>_lesionwise_metrics.csv
     */
    [[nodiscard]] static std::filesystem::path
    lesionDetailsPathFor(const std::filesystem::path& predictionPath);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lesion_eval::services
