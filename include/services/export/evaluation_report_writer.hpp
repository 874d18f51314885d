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

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief CSV persistence of evaluation reports
 *
 * Writes the per-tissue results table and the per-lesion detail table.
 * Cells containing the delimiter, quotes or newlines are quoted.
 *
 * @example
 * @code
 * auto result = EvaluationReportWriter::writeResults(report, "case_results.csv");
 * if (!result) {
 *     std::cerr << result.error().toString() << std::endl;
 * }
 * @endcode
 */
class EvaluationReportWriter {
public:
    /**
     * @brief Write one row per tissue type in report order
     *
     * @return Success or IoFailed if the file cannot be written
     */
    [[nodiscard]] static std::expected<void, EvaluationError>
    writeResults(const EvaluationReport& report, const std::filesystem::path& path);

    /**
     * @brief Write every lesion record, grouped by tissue type
     */
    [[nodiscard]] static std::expected<void, EvaluationError>
    writeLesionDetails(const EvaluationReport& report, const std::filesystem::path& path);

    /**
     * @brief Render a CSV line without the trailing newline
     */
    [[nodiscard]] static std::string formatCsvLine(const std::vector<std::string>& cells,
                                                   char delimiter = ',');
};

}  // namespace lesion_eval::services
