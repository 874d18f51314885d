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

#include "services/evaluation/lesion_morphology.hpp"
#include "services/evaluation/volume_geometry.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include <itkBinaryDilateImageFilter.h>
#include <itkConnectedComponentImageFilter.h>
#include <itkFlatStructuringElement.h>

namespace lesion_eval::services {

namespace {

using StructuringElementType = itk::FlatStructuringElement<3>;

/**
 * @brief Radius-1 box restricted to offsets with city-block norm <= order
 *
 * Order 1 gives the 6-neighborhood cross, order 2 the 18-neighborhood,
 * order 3 the full 26-neighborhood box.
 */
StructuringElementType createConnectivityElement(int order) {
    StructuringElementType::RadiusType radius;
    radius.Fill(1);

    auto element = StructuringElementType::Box(radius);
    for (unsigned int i = 0; i < element.Size(); ++i) {
        auto offset = element.GetOffset(i);
        int norm = std::abs(static_cast<int>(offset[0]))
                 + std::abs(static_cast<int>(offset[1]))
                 + std::abs(static_cast<int>(offset[2]));
        element[i] = norm <= order;
    }
    element.SetDecomposable(false);

    return element;
}

}  // anonymous namespace

std::expected<ComponentLabeling, EvaluationError>
LesionMorphology::labelComponents(BinaryMaskType::Pointer mask, bool fullyConnected) {
    if (!mask) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Input mask is null"});
    }

    try {
        using ConnectedFilter = itk::ConnectedComponentImageFilter<BinaryMaskType, ComponentMapType>;
        auto connected = ConnectedFilter::New();
        connected->SetInput(mask);
        connected->SetFullyConnected(fullyConnected);
        connected->SetBackgroundValue(0);
        connected->Update();

        ComponentLabeling labeling;
        labeling.components = connected->GetOutput();
        labeling.components->DisconnectPipeline();
        labeling.componentCount = static_cast<LesionId>(connected->GetObjectCount());
        return labeling;
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

std::expected<BinaryMaskType::Pointer, EvaluationError>
LesionMorphology::dilate(BinaryMaskType::Pointer mask, int connectivityOrder, int iterations) {
    if (!mask) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidInput,
            "Input mask is null"});
    }

    if (connectivityOrder < 1 || connectivityOrder > 3) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Connectivity order must be between 1 and 3"});
    }

    if (iterations < 1) {
        return std::unexpected(EvaluationError{
            EvaluationError::Code::InvalidParameters,
            "Dilation iterations must be at least 1"});
    }

    try {
        using FilterType = itk::BinaryDilateImageFilter<
            BinaryMaskType, BinaryMaskType, StructuringElementType>;

        auto element = createConnectivityElement(connectivityOrder);
        BinaryMaskType::Pointer current = mask;

        for (int pass = 0; pass < iterations; ++pass) {
            auto filter = FilterType::New();
            filter->SetInput(current);
            filter->SetKernel(element);
            filter->SetForegroundValue(1);
            filter->SetBackgroundValue(0);
            filter->SetBoundaryToForeground(false);
            filter->Update();

            current = filter->GetOutput();
            current->DisconnectPipeline();
        }

        return current;
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

LesionId LesionMorphology::maxComponentId(ComponentMapType::Pointer components) {
    if (!components) {
        return 0;
    }
    const auto* buf = components->GetBufferPointer();
    size_t totalVoxels = geometry::voxelCount(components.GetPointer());
    LesionId maxId = 0;
    for (size_t i = 0; i < totalVoxels; ++i) {
        maxId = std::max(maxId, buf[i]);
    }
    return maxId;
}

}  // namespace lesion_eval::services
