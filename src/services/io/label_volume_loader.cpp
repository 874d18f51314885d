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

#include "services/io/label_volume_loader.hpp"
#include "services/evaluation/volume_geometry.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <set>

#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkImageIOBase.h>
#include <itkNiftiImageIO.h>
#include <itkNrrdImageIO.h>

namespace lesion_eval::services {

namespace {

constexpr uint8_t kMaxKnownLabel = 3;

bool isNrrd(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    return ext == ".nrrd" || ext == ".nhdr";
}

bool isNifti(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    auto stem = path.stem().extension().string();
    return ext == ".nii" || (ext == ".gz" && stem == ".nii");
}

/// Dedicated ImageIO for known extensions, nullptr to defer to the IO factory
itk::ImageIOBase::Pointer imageIOFor(const std::filesystem::path& path) {
    // Explicitly set ImageIO to avoid IO factory registration issues
    if (isNrrd(path)) {
        return itk::NrrdImageIO::New();
    }
    if (isNifti(path)) {
        return itk::NiftiImageIO::New();
    }
    return nullptr;
}

}  // anonymous namespace

class LabelVolumeLoader::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("LabelVolumeLoader")) {}

    void reportUnexpectedLabels(LabelVolumeType::Pointer labels,
                                const std::filesystem::path& path) const {
        const auto* buf = labels->GetBufferPointer();
        size_t totalVoxels = geometry::voxelCount(labels.GetPointer());

        std::set<int> unexpected;
        for (size_t i = 0; i < totalVoxels; ++i) {
            if (buf[i] > kMaxKnownLabel) {
                unexpected.insert(buf[i]);
            }
        }

        if (!unexpected.empty()) {
            logger->warn("{}: {} unexpected label value(s), largest {}; treated as background",
                         path.string(), unexpected.size(), *unexpected.rbegin());
        }
    }
};

LabelVolumeLoader::LabelVolumeLoader()
    : impl_(std::make_unique<Impl>())
{
}

LabelVolumeLoader::~LabelVolumeLoader() = default;

LabelVolumeLoader::LabelVolumeLoader(LabelVolumeLoader&&) noexcept = default;
LabelVolumeLoader& LabelVolumeLoader::operator=(LabelVolumeLoader&&) noexcept = default;

bool LabelVolumeLoader::isSupportedFile(const std::filesystem::path& path) {
    return isNifti(path) || isNrrd(path);
}

std::expected<LabelVolume, EvaluationError>
LabelVolumeLoader::load(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        impl_->logger->error("File not found: {}", path.string());
        return std::unexpected(EvaluationError{
            EvaluationError::Code::IoFailed,
            "File not found: " + path.string()
        });
    }

    try {
        using ReaderType = itk::ImageFileReader<LabelVolumeType>;
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());
        if (auto io = imageIOFor(path)) {
            reader->SetImageIO(io);
        }
        reader->Update();

        LabelVolume volume;
        volume.labels = reader->GetOutput();
        volume.labels->DisconnectPipeline();

        auto spacing = volume.labels->GetSpacing();
        volume.spacing = {spacing[0], spacing[1], spacing[2]};

        auto size = volume.labels->GetLargestPossibleRegion().GetSize();
        impl_->logger->info("Loaded {} ({}x{}x{}, spacing {:.3f}x{:.3f}x{:.3f})",
                            path.string(), size[0], size[1], size[2],
                            volume.spacing[0], volume.spacing[1], volume.spacing[2]);

        impl_->reportUnexpectedLabels(volume.labels, path);
        return volume;
    } catch (const itk::ExceptionObject& e) {
        impl_->logger->error("Failed to read {}: {}", path.string(), e.GetDescription());
        return std::unexpected(EvaluationError{
            EvaluationError::Code::IoFailed,
            std::string("Failed to read ") + path.string() + ": " + e.GetDescription()
        });
    }
}

std::expected<void, EvaluationError>
LabelVolumeLoader::save(const LabelVolume& volume, const std::filesystem::path& path) const {
    if (!volume.labels) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Label volume not initialized"
        });
    }

    try {
        auto output = geometry::allocateLike<LabelVolumeType>(volume.labels.GetPointer());
        const auto* src = volume.labels->GetBufferPointer();
        auto* dst = output->GetBufferPointer();
        std::copy(src, src + geometry::voxelCount(volume.labels.GetPointer()), dst);
        geometry::applySpacing(output.GetPointer(), volume.spacing);

        using WriterType = itk::ImageFileWriter<LabelVolumeType>;
        auto writer = WriterType::New();
        writer->SetInput(output);
        writer->SetFileName(path.string());
        if (auto io = imageIOFor(path)) {
            writer->SetImageIO(io);
        }
        writer->Update();

        impl_->logger->info("Saved label volume to {}", path.string());
        return {};
    } catch (const itk::ExceptionObject& e) {
        impl_->logger->error("Failed to write {}: {}", path.string(), e.GetDescription());
        return std::unexpected(EvaluationError{
            EvaluationError::Code::IoFailed,
            std::string("Failed to export: ") + e.GetDescription()
        });
    }
}

}  // namespace lesion_eval::services
