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
 * @file main.cpp
 * @brief Command-line driver for lesion-wise segmentation evaluation
 *
 * Scores a predicted tumor segmentation against its ground truth for the
 * WT, TC and ET tissue types and writes the results table next to the
 * prediction (or to --output).
 */

#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "core/evaluation_config.hpp"
#include "core/logging.hpp"
#include "services/evaluation/case_evaluator.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace lesion_eval;

int main(int argc, char* argv[]) {
    po::options_description desc("lesion_eval - lesion-wise tumor segmentation scoring\n\nUsage");
    desc.add_options()
        ("help,h", "Show this help message")
        ("prediction", po::value<std::string>()->required(),
            "Predicted label volume (.nii, .nii.gz, .nrrd)")
        ("ground-truth", po::value<std::string>()->required(),
            "Ground-truth label volume")
        ("config,c", po::value<std::string>(),
            "JSON evaluation configuration")
        ("output,o", po::value<std::string>(),
            "Results CSV (default: <prediction dir>/<case>_results.csv)")
        ("lesion-details", po::bool_switch()->default_value(false),
            "Also write the per-lesion metrics table")
        ("parallel", po::bool_switch()->default_value(false),
            "Evaluate WT, TC and ET concurrently")
        ("verbose,v", po::bool_switch()->default_value(false),
            "Enable debug logging");

    po::positional_options_description pos;
    pos.add("prediction", 1);
    pos.add("ground-truth", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(desc)
            .positional(pos)
            .run(), vm);

        if (vm.count("help") || argc < 2) {
            std::cout << desc << "\n";
            std::cout << "\nExamples:" << "\n";
            std::cout << "  lesion_eval case_001_pred.nii.gz case_001_seg.nii.gz" << "\n";
            std::cout << "  lesion_eval pred.nii.gz seg.nii.gz -c eval.json --lesion-details" << "\n";
            return 0;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return 1;
    }

    core::EvaluationConfig config;
    if (vm.count("config")) {
        fs::path configPath = vm["config"].as<std::string>();
        auto loaded = core::loadEvaluationConfig(configPath);
        if (!loaded) {
            std::cerr << "Error: " << configPath.string() << ": "
                      << core::toString(loaded.error()) << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (vm["lesion-details"].as<bool>()) {
        config.writeLesionDetails = true;
    }
    if (vm["parallel"].as<bool>()) {
        config.parallelTissues = true;
    }

    logging::LogConfig logConfig;
    logConfig.level = vm["verbose"].as<bool>()
        ? logging::LogLevel::Debug
        : logging::logLevelFromString(config.logLevel);
    if (!config.logDirectory.empty()) {
        logConfig.enableFileLogging = true;
        logConfig.logDirectory = config.logDirectory;
    }
    logging::LoggerFactory::configure(logConfig);

    auto logger = logging::LoggerFactory::create("lesion_eval");
    logger->debug("Effective configuration: {}", core::toJson(config).dump());

    std::optional<fs::path> outputPath;
    if (vm.count("output")) {
        outputPath = vm["output"].as<std::string>();
    }

    services::CaseEvaluator evaluator(config);
    auto outputs = evaluator.run(vm["prediction"].as<std::string>(),
                                 vm["ground-truth"].as<std::string>(),
                                 outputPath);
    if (!outputs) {
        logger->error("Evaluation failed: {}", outputs.error().toString());
        logging::LoggerFactory::shutdown();
        return 1;
    }

    std::cout << outputs->report.toString();
    std::cout << "Results: " << outputs->resultsPath.string() << "\n";
    if (outputs->lesionDetailsPath) {
        std::cout << "Lesion details: " << outputs->lesionDetailsPath->string() << "\n";
    }

    logging::LoggerFactory::shutdown();
    return 0;
}
