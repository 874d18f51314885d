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
 * @file evaluation_config.hpp
 * @brief Tunable constants of the lesion-wise evaluation protocol
 * @details Holds the dilation, connectivity, volume threshold, HD95 penalty
 *          and output options shared by every tissue evaluation of a case.
 *          Values are read from a JSON file; missing keys keep the defaults
 *          defined in evaluation_constants.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <limits>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace lesion_eval::core {

/// Default values of the evaluation protocol
namespace evaluation_constants {
    /// Binary dilation passes applied to the ground truth before merging
    inline constexpr int kDilationIterations = 1;

    /// Structuring element reach: 1 = faces, 2 = faces + edges, 3 = full cube
    inline constexpr int kDilationConnectivity = 2;

    /// Lesions at or below this physical volume are excluded from lesion-wise scores
    inline constexpr double kLesionVolumeThreshold = 5.0;

    /// Distance substituted for infinite HD95 and charged per false positive
    inline constexpr double kHd95Penalty = 374.0;

    inline constexpr double kHausdorffPercentile = 95.0;

    /// Guards zero denominators in sensitivity/specificity
    inline constexpr double kEpsilon = std::numeric_limits<double>::min();
}  // namespace evaluation_constants

/**
 * @brief Error codes for configuration loading
 */
enum class ConfigError {
    FileOpenFailed,
    InvalidFormat,
    InvalidValue
};

[[nodiscard]] std::string toString(ConfigError error);

/**
 * @brief Evaluation protocol settings
 */
struct EvaluationConfig {
    int dilationIterations = evaluation_constants::kDilationIterations;
    int dilationConnectivity = evaluation_constants::kDilationConnectivity;

    /// true = 26-neighborhood lesions, false = 6-neighborhood
    bool fullyConnectedComponents = true;

    double lesionVolumeThreshold = evaluation_constants::kLesionVolumeThreshold;
    double hd95Penalty = evaluation_constants::kHd95Penalty;
    double hausdorffPercentile = evaluation_constants::kHausdorffPercentile;
    double epsilon = evaluation_constants::kEpsilon;

    /// Evaluate WT, TC and ET concurrently
    bool parallelTissues = false;

    /// Also write the per-lesion detail table next to the results table
    bool writeLesionDetails = false;

    std::string logLevel = "info";

    /// Empty disables file logging
    std::filesystem::path logDirectory;

    [[nodiscard]] bool isValid() const noexcept {
        return dilationIterations >= 1
            && dilationConnectivity >= 1 && dilationConnectivity <= 3
            && lesionVolumeThreshold >= 0.0
            && hd95Penalty > 0.0
            && hausdorffPercentile > 0.0 && hausdorffPercentile <= 100.0
            && epsilon > 0.0;
    }
};

/**
 * @brief Build a configuration from a parsed JSON object
 *
 * Unknown keys are ignored and missing keys keep their defaults.
 *
 * @return Configuration, InvalidFormat on type errors, InvalidValue if
 *         the result fails EvaluationConfig::isValid()
 */
[[nodiscard]] std::expected<EvaluationConfig, ConfigError>
evaluationConfigFromJson(const nlohmann::json& j);

[[nodiscard]] nlohmann::json toJson(const EvaluationConfig& config);

/**
 * @brief Load a configuration from a JSON file
 */
[[nodiscard]] std::expected<EvaluationConfig, ConfigError>
loadEvaluationConfig(const std::filesystem::path& path);

}  // namespace lesion_eval::core
