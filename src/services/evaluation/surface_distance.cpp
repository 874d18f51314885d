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

#include "services/evaluation/surface_distance.hpp"
#include "services/evaluation/volume_geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include <itkSignedMaurerDistanceMapImageFilter.h>

namespace lesion_eval::services {

namespace {

using DistanceMapType = itk::Image<float, 3>;

bool isEmpty(const BinaryMaskType* mask) {
    const auto* buf = mask->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(mask);
    return std::none_of(buf, buf + totalVoxels, [](uint8_t v) { return v != 0; });
}

/**
 * @brief Distance from every voxel to the closest foreground voxel of the surface
 */
DistanceMapType::Pointer distanceToSurface(BinaryMaskType::Pointer surface) {
    using FilterType = itk::SignedMaurerDistanceMapImageFilter<BinaryMaskType, DistanceMapType>;
    auto filter = FilterType::New();
    filter->SetInput(surface);
    filter->SetBackgroundValue(0);
    filter->SetUseImageSpacing(true);
    filter->SetSquaredDistance(false);
    filter->SetInsideIsPositive(false);
    filter->Update();

    auto output = filter->GetOutput();
    output->DisconnectPipeline();
    return output;
}

/**
 * @brief Sample the distance map at every surface voxel of the source
 *
 * Surface voxels lie on the boundary of the one-voxel-thick surface image,
 * so the signed map is zero there; the magnitude is taken everywhere.
 */
std::vector<double> sampleDistances(const BinaryMaskType* sourceSurface,
                                    const DistanceMapType* targetDistance) {
    const auto* surfaceBuf = sourceSurface->GetBufferPointer();
    const auto* distanceBuf = targetDistance->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(sourceSurface);

    std::vector<double> distances;
    for (size_t i = 0; i < totalVoxels; ++i) {
        if (surfaceBuf[i] != 0) {
            distances.push_back(std::abs(static_cast<double>(distanceBuf[i])));
        }
    }
    std::sort(distances.begin(), distances.end());
    return distances;
}

size_t countNonZero(const BinaryMaskType* mask) {
    const auto* buf = mask->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(mask);
    return static_cast<size_t>(
        std::count_if(buf, buf + totalVoxels, [](uint8_t v) { return v != 0; }));
}

double directedPercentile(const std::vector<double>& sorted, double percentile) {
    if (sorted.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    auto n = static_cast<double>(sorted.size());
    auto rank = static_cast<long long>(std::ceil(percentile * n / 100.0)) - 1;
    rank = std::clamp<long long>(rank, 0, static_cast<long long>(sorted.size()) - 1);
    return sorted[static_cast<size_t>(rank)];
}

}  // anonymous namespace

BinaryMaskType::Pointer SurfaceDistance::extractSurface(BinaryMaskType::Pointer mask) {
    auto surface = geometry::allocateLike<BinaryMaskType>(mask.GetPointer());
    auto size = mask->GetLargestPossibleRegion().GetSize();
    const auto nx = static_cast<long long>(size[0]);
    const auto ny = static_cast<long long>(size[1]);
    const auto nz = static_cast<long long>(size[2]);

    const auto* bufIn = mask->GetBufferPointer();
    auto* bufOut = surface->GetBufferPointer();

    auto isForeground = [&](long long x, long long y, long long z) {
        if (x < 0 || y < 0 || z < 0 || x >= nx || y >= ny || z >= nz) {
            return false;
        }
        return bufIn[(z * ny + y) * nx + x] != 0;
    };

    for (long long z = 0; z < nz; ++z) {
        for (long long y = 0; y < ny; ++y) {
            for (long long x = 0; x < nx; ++x) {
                if (!isForeground(x, y, z)) continue;

                bool boundary = !isForeground(x - 1, y, z) || !isForeground(x + 1, y, z)
                             || !isForeground(x, y - 1, z) || !isForeground(x, y + 1, z)
                             || !isForeground(x, y, z - 1) || !isForeground(x, y, z + 1);
                if (boundary) {
                    bufOut[(z * ny + y) * nx + x] = 1;
                }
            }
        }
    }

    return surface;
}

std::expected<SurfaceDistances, EvaluationError>
SurfaceDistance::compute(BinaryMaskType::Pointer maskA,
                         BinaryMaskType::Pointer maskB,
                         const SpacingType& spacing) {
    auto validation = geometry::validateSameShape(maskA.GetPointer(), maskB.GetPointer());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    if (spacing[0] <= 0 || spacing[1] <= 0 || spacing[2] <= 0) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Spacing values must be positive"});
    }

    try {
        auto surfaceA = extractSurface(maskA);
        auto surfaceB = extractSurface(maskB);
        geometry::applySpacing(surfaceA.GetPointer(), spacing);
        geometry::applySpacing(surfaceB.GetPointer(), spacing);

        SurfaceDistances result;
        const bool emptyA = isEmpty(surfaceA);
        const bool emptyB = isEmpty(surfaceB);

        if (!emptyA && !emptyB) {
            auto distanceToA = distanceToSurface(surfaceA);
            auto distanceToB = distanceToSurface(surfaceB);
            result.distancesAToB = sampleDistances(surfaceA, distanceToB);
            result.distancesBToA = sampleDistances(surfaceB, distanceToA);
        } else if (!emptyA) {
            result.distancesAToB.assign(countNonZero(surfaceA),
                                        std::numeric_limits<double>::infinity());
        } else if (!emptyB) {
            result.distancesBToA.assign(countNonZero(surfaceB),
                                        std::numeric_limits<double>::infinity());
        }

        return result;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()});
    }
    catch (const std::exception& e) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InternalError,
            std::string("Standard exception: ") + e.what()});
    }
}

double SurfaceDistance::robustHausdorff(const SurfaceDistances& distances, double percentile) {
    double aToB = directedPercentile(distances.distancesAToB, percentile);
    double bToA = directedPercentile(distances.distancesBToA, percentile);
    return std::max(aToB, bToA);
}

}  // namespace lesion_eval::services
