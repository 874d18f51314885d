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

#include "services/export/evaluation_report_writer.hpp"

#include <fstream>

namespace lesion_eval::services {

namespace {

/**
 * @brief Escape a string for CSV output
 *
 * If the value contains delimiter, quotes, or newlines, wrap in quotes
 * and escape internal quotes by doubling them.
 */
std::string escapeCSV(const std::string& value, char delimiter) {
    bool needsQuotes = value.find(delimiter) != std::string::npos
                    || value.find_first_of("\"\n\r") != std::string::npos;

    if (!needsQuotes) {
        return value;
    }

    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::expected<void, EvaluationError>
writeCsvFile(const std::filesystem::path& path,
             const std::vector<std::string>& header,
             const std::vector<std::vector<std::string>>& rows) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::IoFailed,
            "Cannot open file: " + path.string()
        });
    }

    out << EvaluationReportWriter::formatCsvLine(header) << "\n";
    for (const auto& row : rows) {
        out << EvaluationReportWriter::formatCsvLine(row) << "\n";
    }

    out.flush();
    if (!out) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::IoFailed,
            "Failed to write file: " + path.string()
        });
    }
    return {};
}

}  // anonymous namespace

std::string EvaluationReportWriter::formatCsvLine(const std::vector<std::string>& cells,
                                                  char delimiter) {
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line += delimiter;
        }
        line += escapeCSV(cells[i], delimiter);
    }
    return line;
}

std::expected<void, EvaluationError>
EvaluationReportWriter::writeResults(const EvaluationReport& report,
                                     const std::filesystem::path& path) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(report.rows.size());
    for (const auto& row : report.rows) {
        rows.push_back(row.getCsvRow());
    }
    return writeCsvFile(path, TissueResult::getCsvHeader(), rows);
}

std::expected<void, EvaluationError>
EvaluationReportWriter::writeLesionDetails(const EvaluationReport& report,
                                           const std::filesystem::path& path) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& row : report.rows) {
        for (const auto& record : row.lesionRecords) {
            rows.push_back(record.getCsvRow(row.tissue));
        }
    }
    return writeCsvFile(path, MatchRecord::getCsvHeader(), rows);
}

}  // namespace lesion_eval::services
