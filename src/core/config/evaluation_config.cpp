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

#include "core/evaluation_config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace lesion_eval::core {

std::string toString(ConfigError error) {
    switch (error) {
        case ConfigError::FileOpenFailed: return "Failed to open configuration file";
        case ConfigError::InvalidFormat:  return "Malformed configuration";
        case ConfigError::InvalidValue:   return "Configuration value out of range";
    }
    return "Unknown configuration error";
}

std::expected<EvaluationConfig, ConfigError>
evaluationConfigFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected(ConfigError::InvalidFormat);
    }

    EvaluationConfig config;
    try {
        config.dilationIterations = j.value("dilation_iterations", config.dilationIterations);
        config.dilationConnectivity = j.value("dilation_connectivity", config.dilationConnectivity);
        config.fullyConnectedComponents =
            j.value("fully_connected_components", config.fullyConnectedComponents);
        config.lesionVolumeThreshold =
            j.value("lesion_volume_threshold", config.lesionVolumeThreshold);
        config.hd95Penalty = j.value("hd95_penalty", config.hd95Penalty);
        config.hausdorffPercentile = j.value("hausdorff_percentile", config.hausdorffPercentile);
        config.epsilon = j.value("epsilon", config.epsilon);
        config.parallelTissues = j.value("parallel_tissues", config.parallelTissues);
        config.writeLesionDetails = j.value("write_lesion_details", config.writeLesionDetails);
        config.logLevel = j.value("log_level", config.logLevel);
        config.logDirectory = j.value("log_directory", std::string{});
    } catch (const nlohmann::json::type_error&) {
        return std::unexpected(ConfigError::InvalidFormat);
    }

    if (!config.isValid()) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    return config;
}

nlohmann::json toJson(const EvaluationConfig& config) {
    return {
        {"dilation_iterations", config.dilationIterations},
        {"dilation_connectivity", config.dilationConnectivity},
        {"fully_connected_components", config.fullyConnectedComponents},
        {"lesion_volume_threshold", config.lesionVolumeThreshold},
        {"hd95_penalty", config.hd95Penalty},
        {"hausdorff_percentile", config.hausdorffPercentile},
        {"epsilon", config.epsilon},
        {"parallel_tissues", config.parallelTissues},
        {"write_lesion_details", config.writeLesionDetails},
        {"log_level", config.logLevel},
        {"log_directory", config.logDirectory.string()}
    };
}

std::expected<EvaluationConfig, ConfigError>
loadEvaluationConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(ConfigError::FileOpenFailed);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error&) {
        return std::unexpected(ConfigError::InvalidFormat);
    }

    return evaluationConfigFromJson(j);
}

}  // namespace lesion_eval::core
