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
 * @file i_rendering_engine.hpp
 * @brief Contract of the external rendering engine collaborator
 * @details The coordinator never draws pixels itself. It binds viewports to
 *          display surfaces, reads and writes camera and window/level state,
 *          asks for renders, and observes change notifications, all through
 *          this interface. Implementations may throw std::exception
 *          subclasses; every call site in the coordinator isolates them.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

class QWidget;

namespace viewport_coordinator::services {

/**
 * @brief Opaque handle returned by the renderer for a bound viewport
 */
struct RenderHandle {
    std::uint64_t value = 0;

    [[nodiscard]] bool isValid() const noexcept { return value != 0; }

    friend bool operator==(const RenderHandle&, const RenderHandle&) = default;
};

/**
 * @brief Kind of rendering pipeline behind a viewport
 */
enum class ViewportKind {
    Stack,         ///< 2D image stack
    Orthographic,  ///< Volume resliced on an orthogonal plane
    Volume3D       ///< 3D volume rendering
};

/**
 * @brief Slice orientation for stack and orthographic viewports
 */
enum class SliceOrientation {
    Axial,
    Sagittal,
    Coronal
};

/**
 * @brief Options passed to the renderer when binding a viewport
 */
struct ViewportOptions {
    std::array<double, 3> background = {0.0, 0.0, 0.0};
    SliceOrientation orientation = SliceOrientation::Axial;
};

/**
 * @brief View transform of one viewport
 */
struct Camera {
    std::array<double, 3> position = {0.0, 0.0, 1.0};
    std::array<double, 3> focalPoint = {0.0, 0.0, 0.0};
    std::array<double, 3> viewUp = {0.0, 1.0, 0.0};
    double parallelScale = 1.0;
    double viewAngle = 30.0;
    bool parallelProjection = true;
    bool flipHorizontal = false;
    bool flipVertical = false;

    /**
     * @brief All components finite and a positive parallel scale
     */
    [[nodiscard]] bool isValid() const noexcept {
        auto finite = [](const std::array<double, 3>& v) {
            return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
        };
        return finite(position) && finite(focalPoint) && finite(viewUp)
            && std::isfinite(parallelScale) && parallelScale > 0.0
            && std::isfinite(viewAngle);
    }

    friend bool operator==(const Camera&, const Camera&) = default;
};

/**
 * @brief Intensity window mapped to display grey levels
 */
struct VoiRange {
    double lower = 0.0;
    double upper = 0.0;

    [[nodiscard]] double window() const noexcept { return upper - lower; }
    [[nodiscard]] double level() const noexcept { return (upper + lower) / 2.0; }

    [[nodiscard]] static VoiRange fromWindowLevel(double window, double level) noexcept {
        return {level - window / 2.0, level + window / 2.0};
    }

    friend bool operator==(const VoiRange&, const VoiRange&) = default;
};

enum class InterpolationType {
    Linear,
    Nearest
};

/**
 * @brief Display properties other than the camera
 */
struct ViewportProperties {
    std::optional<VoiRange> voiRange;
    bool invert = false;
    InterpolationType interpolation = InterpolationType::Linear;

    friend bool operator==(const ViewportProperties&, const ViewportProperties&) = default;
};

/**
 * @brief Change notifications emitted by the renderer
 */
enum class RenderEvent {
    CameraModified,
    VoiModified,
    ImageRendered
};

/// Identifies one observer registration on one binding
using ObserverId = std::uint64_t;

/**
 * @brief Abstract rendering engine
 *
 * Binding is keyed by the caller-chosen viewport id; all other calls use the
 * handle returned by bind().
 */
class IRenderingEngine {
public:
    using EventCallback = std::function<void(const std::string& viewportId, RenderEvent event)>;

    virtual ~IRenderingEngine() = default;

    /**
     * @brief Bind a viewport to a display surface
     * @param viewportId Unique viewport identifier
     * @param surface Display region to render into (non-owning)
     * @param kind Rendering pipeline kind
     * @param options Initial options
     * @return Handle for subsequent calls
     */
    virtual RenderHandle bind(const std::string& viewportId, QWidget* surface,
                              ViewportKind kind, const ViewportOptions& options) = 0;

    /**
     * @brief Release the binding of a viewport; unknown ids are ignored
     */
    virtual void unbind(const std::string& viewportId) = 0;

    [[nodiscard]] virtual std::optional<RenderHandle> getHandle(
        const std::string& viewportId) const = 0;

    [[nodiscard]] virtual Camera getCamera(RenderHandle handle) const = 0;

    virtual void setCamera(RenderHandle handle, const Camera& camera) = 0;

    [[nodiscard]] virtual ViewportProperties getProperties(RenderHandle handle) const = 0;

    virtual void setProperties(RenderHandle handle, const ViewportProperties& properties) = 0;

    /**
     * @brief Identifier of the image currently displayed, if any
     */
    [[nodiscard]] virtual std::optional<std::string> currentImageId(RenderHandle handle) const = 0;

    virtual void render(RenderHandle handle) = 0;

    virtual void renderAll() = 0;

    virtual ObserverId addObserver(RenderHandle handle, RenderEvent event,
                                   EventCallback callback) = 0;

    /**
     * @brief Remove an observer
     * @return true if the observer existed
     */
    virtual bool removeObserver(RenderHandle handle, ObserverId observer) = 0;

    /**
     * @brief Best-effort reclamation hint (image cache purge)
     * @return Bytes released, or nullopt if the engine has no cache to purge
     */
    virtual std::optional<std::size_t> purgeCache() { return std::nullopt; }
};

}  // namespace viewport_coordinator::services
