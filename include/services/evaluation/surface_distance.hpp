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
 * @file surface_distance.hpp
 * @brief Surface-to-surface distances between binary masks
 * @details Extracts the boundary voxels of two masks and measures, in
 *          physical units, the distance from every boundary voxel of one
 *          mask to the closest boundary voxel of the other. The robust
 *          Hausdorff distance is the larger of the two directional
 *          percentiles.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <vector>

#include <itkImage.h>

#include "core/evaluation_config.hpp"
#include "services/evaluation/evaluation_types.hpp"

namespace lesion_eval::services {

/**
 * @brief Directed surface distances between two masks
 */
struct SurfaceDistances {
    /// For each surface voxel of A, distance to the surface of B (ascending)
    std::vector<double> distancesAToB;

    /// For each surface voxel of B, distance to the surface of A (ascending)
    std::vector<double> distancesBToA;
};

/**
 * @brief Surface distance primitive used for HD95
 *
 * A surface voxel is a foreground voxel with at least one face neighbor
 * that is background or lies outside the volume. Distances are exact
 * Euclidean distances between voxel centers, scaled by the voxel spacing.
 */
class SurfaceDistance {
public:
    /**
     * @brief Compute both directed surface distance sets
     *
     * @param maskA First binary mask
     * @param maskB Second binary mask
     * @param spacing Physical voxel spacing
     * @return Sorted distances; a direction is empty when its source mask is
     *         empty and filled with +infinity when only the target is empty
     */
    [[nodiscard]] static std::expected<SurfaceDistances, EvaluationError>
    compute(BinaryMaskType::Pointer maskA,
            BinaryMaskType::Pointer maskB,
            const SpacingType& spacing);

    /**
     * @brief Percentile Hausdorff distance
     *
     * For each direction the value at sorted index ceil(p·n/100) - 1 is
     * taken; the result is the maximum of both directions.
     *
     * @return Distance, or +infinity if either direction is empty
     */
    [[nodiscard]] static double robustHausdorff(
        const SurfaceDistances& distances,
        double percentile = core::evaluation_constants::kHausdorffPercentile);

    /**
     * @brief Binary mask of surface voxels
     */
    [[nodiscard]] static BinaryMaskType::Pointer extractSurface(BinaryMaskType::Pointer mask);
};

}  // namespace lesion_eval::services
