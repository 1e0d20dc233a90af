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
 * @file viewport_registry.hpp
 * @brief Authoritative registry of viewport bindings
 * @details Maps viewport ids to their renderer binding, display surface and
 *          activation state, and owns the renderer observer subscriptions
 *          attached on behalf of other components. Removing a viewport
 *          releases every subscription it owns before unbinding it.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/render/i_rendering_engine.hpp"
#include "services/viewport/viewport_types.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class QWidget;

namespace viewport_coordinator::services {

/**
 * @brief Registry of bound viewports
 *
 * Exactly one viewport is active while the registry is non-empty. The first
 * viewport created into an empty registry becomes active; removing the
 * active viewport promotes the first remaining one in insertion order.
 *
 * Renderer exceptions never escape the registry: bind failures are reported
 * as RendererFailure, all other renderer failures are logged.
 */
class ViewportRegistry {
public:
    /// Called after a viewport has been removed
    using RemovalCallback = std::function<void(const std::string& viewportId)>;

    /**
     * @brief Construct a registry over a rendering engine
     * @param renderer Rendering collaborator (must outlive the registry)
     * @param minimumSurfaceExtent Fallback width/height for zero-sized surfaces
     */
    explicit ViewportRegistry(IRenderingEngine& renderer, int minimumSurfaceExtent = 200);
    ~ViewportRegistry();

    // Non-copyable
    ViewportRegistry(const ViewportRegistry&) = delete;
    ViewportRegistry& operator=(const ViewportRegistry&) = delete;

    /**
     * @brief Bind a display surface to the renderer under a new id
     *
     * Creating an id that already exists returns the existing viewport.
     *
     * @param id Unique viewport identifier
     * @param surface Display surface (non-owning)
     * @param kind Rendering pipeline kind
     * @param options Initial renderer options
     * @return Created (or existing) viewport, or error
     */
    [[nodiscard]] std::expected<Viewport, ViewportError> create(
        const std::string& id, QWidget* surface,
        ViewportKind kind = ViewportKind::Stack,
        const ViewportOptions& options = {});

    /**
     * @brief Remove a viewport, its listeners and its renderer binding
     * @return false if the id is unknown
     */
    bool remove(const std::string& id);

    /**
     * @brief Remove every viewport
     * @return Number of viewports removed
     */
    size_t removeAll();

    bool setActive(const std::string& id);

    [[nodiscard]] std::optional<Viewport> get(const std::string& id) const;
    [[nodiscard]] bool has(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> allIds() const;
    [[nodiscard]] size_t count() const noexcept;
    [[nodiscard]] std::optional<std::string> activeId() const;

    /**
     * @brief Render every bound viewport; renderer failures are logged
     */
    void renderAll();

    /**
     * @brief Render one viewport
     * @return false if the id is unknown or the renderer failed
     */
    bool render(const std::string& id);

    /**
     * @brief Attach a renderer observer owned by the viewport entry
     * @param id Viewport to observe
     * @param event Renderer event
     * @param callback Invoked with the viewport id and event
     * @param tag Owner tag used for bulk detachment
     * @return Handle, or nullopt if the viewport is unknown or the renderer failed
     */
    std::optional<ListenerHandle> attachListener(const std::string& id, RenderEvent event,
                                                 IRenderingEngine::EventCallback callback,
                                                 const std::string& tag = {});

    bool detachListener(const ListenerHandle& handle);

    /**
     * @brief Detach every listener of a viewport carrying the given tag
     * @return Number of listeners detached
     */
    size_t detachListeners(const std::string& id, const std::string& tag);

    size_t detachAllListeners(const std::string& id);

    [[nodiscard]] size_t listenerCount(const std::string& id) const;
    [[nodiscard]] size_t listenerCount(const std::string& id, const std::string& tag) const;
    [[nodiscard]] size_t totalListenerCount() const;

    [[nodiscard]] IRenderingEngine& renderer() noexcept;
    [[nodiscard]] const IRenderingEngine& renderer() const noexcept;

    void setMinimumSurfaceExtent(int extent);
    [[nodiscard]] int minimumSurfaceExtent() const noexcept;

    void setRemovalCallback(RemovalCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
