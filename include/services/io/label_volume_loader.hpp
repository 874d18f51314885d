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
 * @file label_volume_loader.hpp
 * @brief Reading and writing of multi-class label volumes
 * @details Loads segmentation label volumes from NIfTI or NRRD files into
 *          8-bit ITK images together with their physical voxel spacing.
 *
 * ## Supported Formats
 * | Extension | ImageIO |
 * |-----------|---------|
 * | .nii, .nii.gz | NiftiImageIO |
 * | .nrrd, .nhdr | NrrdImageIO |
 * | other | ITK IO factory |
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <memory>

#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Label volume file IO
 *
 * Labels outside {0,1,2,3} are reported as a warning and kept; every tissue
 * mask treats them as background.
 */
class LabelVolumeLoader {
public:
    LabelVolumeLoader();
    ~LabelVolumeLoader();

    LabelVolumeLoader(const LabelVolumeLoader&) = delete;
    LabelVolumeLoader& operator=(const LabelVolumeLoader&) = delete;
    LabelVolumeLoader(LabelVolumeLoader&&) noexcept;
    LabelVolumeLoader& operator=(LabelVolumeLoader&&) noexcept;

    /**
     * @brief Load a label volume
     *
     * @param path NIfTI or NRRD file
     * @return Labels and spacing, IoFailed if the file is missing or unreadable
     */
    [[nodiscard]] std::expected<LabelVolume, EvaluationError>
    load(const std::filesystem::path& path) const;

    /**
     * @brief Write a label volume, applying its spacing to the image
     */
    [[nodiscard]] std::expected<void, EvaluationError>
    save(const LabelVolume& volume, const std::filesystem::path& path) const;

    /**
     * @brief Check if the extension selects a dedicated ImageIO
     */
    [[nodiscard]] static bool isSupportedFile(const std::filesystem::path& path);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lesion_eval::services
