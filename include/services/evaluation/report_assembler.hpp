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
 * @file report_assembler.hpp
 * @brief Per-case assembly of WT, TC and ET report rows
 * @details Scores the three nested tissue types against the same pair of
 *          label volumes and collects the rows into one EvaluationReport.
 *          The tissue evaluations share no mutable state and may run
 *          concurrently.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <future>
#include <memory>

#include <itkImage.h>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"
#include "services/evaluation/tissue_scorer.hpp"

namespace lesion_eval::services {

/**
 * @brief Build the evaluation report of one case
 *
 * Rows always appear in WT, TC, ET order. A failure in any tissue aborts
 * the case; with parallel evaluation the error of the first tissue in
 * report order is returned.
 *
 * @example
 * @code
 * ReportAssembler assembler(config);
 * auto report = assembler.assemble(prediction, groundTruth, {1.0, 1.0, 1.0});
 * if (report) {
 *     std::cout << report->toString();
 * }
 * @endcode
 */
class ReportAssembler {
public:
    ReportAssembler();
    explicit ReportAssembler(const core::EvaluationConfig& config);
    ~ReportAssembler();

    ReportAssembler(const ReportAssembler&) = delete;
    ReportAssembler& operator=(const ReportAssembler&) = delete;
    ReportAssembler(ReportAssembler&&) noexcept;
    ReportAssembler& operator=(ReportAssembler&&) noexcept;

    /**
     * @brief Score all tissue types
     *
     * @param prediction Predicted label volume
     * @param groundTruth Ground-truth label volume
     * @param spacing Physical voxel spacing shared by both volumes
     * @return Report with one row per tissue type, or the first error
     */
    [[nodiscard]] std::expected<EvaluationReport, EvaluationError>
    assemble(LabelVolumeType::Pointer prediction,
             LabelVolumeType::Pointer groundTruth,
             const SpacingType& spacing) const;

    /**
     * @brief Score all tissue types on a worker thread
     */
    [[nodiscard]] std::future<std::expected<EvaluationReport, EvaluationError>>
    assembleAsync(LabelVolumeType::Pointer prediction,
                  LabelVolumeType::Pointer groundTruth,
                  const SpacingType& spacing) const;

    [[nodiscard]] bool isParallel() const noexcept;
    void setParallel(bool parallel) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lesion_eval::services
