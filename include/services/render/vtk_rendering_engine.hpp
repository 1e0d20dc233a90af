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
 * @file vtk_rendering_engine.hpp
 * @brief VTK implementation of the rendering engine contract
 * @details Each bound viewport owns a vtkRenderer whose active vtkCamera
 *          holds the view transform, and a vtkImageProperty holding the
 *          window/level. When render windows are attached, a
 *          QVTKOpenGLNativeWidget is placed inside the display surface and
 *          renders the viewport; without them (headless use) all state is
 *          still kept and observed but nothing is drawn.
 *
 * ## Thread Safety
 * - All VTK operations must be called from the main (UI) thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/render/i_rendering_engine.hpp"

#include <memory>
#include <optional>
#include <string>

#include <vtkSmartPointer.h>
#include <vtkImageData.h>

class vtkCamera;
class vtkImageProperty;
class vtkRenderer;

namespace viewport_coordinator::services {

/**
 * @brief Copy a vtkCamera into a Camera value
 */
[[nodiscard]] Camera cameraFromVtk(vtkCamera* camera);

/**
 * @brief Apply a Camera value to a vtkCamera (flip flags are not part of vtkCamera)
 */
void applyCameraToVtk(const Camera& camera, vtkCamera* target);

/**
 * @brief Rendering engine backed by one vtkRenderer per viewport
 */
class VtkRenderingEngine : public IRenderingEngine {
public:
    struct Options {
        /// Create a QVTKOpenGLNativeWidget inside each bound surface
        bool attachRenderWindows = true;
    };

    VtkRenderingEngine();
    explicit VtkRenderingEngine(const Options& options);
    ~VtkRenderingEngine() override;

    // Non-copyable
    VtkRenderingEngine(const VtkRenderingEngine&) = delete;
    VtkRenderingEngine& operator=(const VtkRenderingEngine&) = delete;

    RenderHandle bind(const std::string& viewportId, QWidget* surface,
                      ViewportKind kind, const ViewportOptions& options) override;
    void unbind(const std::string& viewportId) override;
    [[nodiscard]] std::optional<RenderHandle> getHandle(const std::string& viewportId) const override;

    [[nodiscard]] Camera getCamera(RenderHandle handle) const override;
    void setCamera(RenderHandle handle, const Camera& camera) override;

    [[nodiscard]] ViewportProperties getProperties(RenderHandle handle) const override;
    void setProperties(RenderHandle handle, const ViewportProperties& properties) override;

    [[nodiscard]] std::optional<std::string> currentImageId(RenderHandle handle) const override;

    void render(RenderHandle handle) override;
    void renderAll() override;

    ObserverId addObserver(RenderHandle handle, RenderEvent event, EventCallback callback) override;
    bool removeObserver(RenderHandle handle, ObserverId observer) override;

    /**
     * @brief Drop cached images no bound viewport is displaying
     * @return Bytes released
     */
    std::optional<std::size_t> purgeCache() override;

    /**
     * @brief Display an image in a viewport and keep it in the image cache
     * @throws std::out_of_range for an unknown handle
     */
    void setImageData(RenderHandle handle, vtkSmartPointer<vtkImageData> image,
                      const std::string& imageId);

    /**
     * @brief Renderer of a binding, or nullptr for an unknown handle
     */
    [[nodiscard]] vtkRenderer* renderer(RenderHandle handle) const;

    [[nodiscard]] size_t bindingCount() const noexcept;
    [[nodiscard]] size_t cachedImageCount() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
