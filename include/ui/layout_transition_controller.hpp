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
 * @file layout_transition_controller.hpp
 * @brief Grid layout of viewports with state-preserving transitions
 * @details Arranges display regions in a rows x cols QGridLayout, binds each
 *          region through the ViewportRegistry under "viewport-<index>", and
 *          carries camera, display properties and annotations across layout
 *          changes. Restoration is deferred with QTimer and polls until each
 *          new binding is ready; every deferred task is tagged with the
 *          transition generation it belongs to and is skipped once a newer
 *          transition has begun.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread (QWidget-derived)
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/coordinator_config.hpp"
#include "services/annotation/annotation_store.hpp"
#include "services/viewport/viewport_registry.hpp"
#include "services/viewport/viewport_types.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QMetaType>
#include <QWidget>

namespace viewport_coordinator::ui {

class DisplayRegion;

/**
 * @brief Phase of a layout transition
 */
enum class TransitionPhase {
    Idle,
    Saving,
    Clearing,
    Rebuilding,
    Restoring
};

[[nodiscard]] const char* transitionPhaseName(TransitionPhase phase) noexcept;

/**
 * @brief Owns the viewport grid and performs layout transitions
 *
 * Seeded layouts: 1x1, 2x2, 1x3, 3x1, 2x3, 3x2. The current layout is empty
 * until the first setLayout() call.
 */
class LayoutTransitionController : public QWidget {
    Q_OBJECT

public:
    LayoutTransitionController(services::ViewportRegistry& registry,
                               services::IAnnotationStore& annotations,
                               const core::CoordinatorConfig& config = {},
                               QWidget* parent = nullptr);
    ~LayoutTransitionController() override;

    // Non-copyable
    LayoutTransitionController(const LayoutTransitionController&) = delete;
    LayoutTransitionController& operator=(const LayoutTransitionController&) = delete;

    // ==================== Layout transitions ====================

    /**
     * @brief Switch to a named layout
     *
     * Unknown names fall back to 1x1. Switching to the current layout returns
     * the current viewports without rebuilding.
     *
     * @param name Layout name
     * @param preserveState Carry camera, properties and annotations over
     * @return Viewports of the new layout in region order
     */
    std::vector<services::Viewport> setLayout(const std::string& name, bool preserveState = true);

    /**
     * @brief Rebuild the 1x1 layout without preservation, even if already current
     */
    std::vector<services::Viewport> resetToDefaultLayout();

    std::vector<services::Viewport> setLayoutWithHistory(const std::string& name,
                                                         bool preserveState = true);
    bool undoLayoutChange();
    bool redoLayoutChange();
    [[nodiscard]] bool canUndo() const noexcept;
    [[nodiscard]] bool canRedo() const noexcept;

    /**
     * @brief Undoable layout switches, oldest first ("2x2 -> 1x1")
     */
    [[nodiscard]] std::vector<std::string> layoutHistory() const;

    // ==================== Dynamic viewports ====================

    bool activateViewport(int index);

    /**
     * @brief Add a viewport without changing the layout
     * @param position Insertion index (appends when absent or out of range)
     * @return New viewport, or nullopt if the layout is full or binding failed
     */
    std::optional<services::Viewport> addViewport(std::optional<int> position = std::nullopt);

    bool removeViewport(int index);
    bool removeViewportById(const std::string& viewportId);

    /**
     * @brief Add a viewport that copies the camera and properties of another
     */
    std::optional<services::Viewport> cloneViewport(int sourceIndex,
                                                    std::optional<int> targetPosition = std::nullopt);

    /**
     * @brief Exchange the grid positions of two viewports
     */
    bool swapViewports(int first, int second);

    /**
     * @brief Disconnect every click-to-activate handler
     * @return Number of handlers disconnected
     */
    size_t detachInteractionHandlers();

    // ==================== Layout configurations ====================

    [[nodiscard]] std::expected<void, services::ViewportError> addLayoutConfig(
        const std::string& name, int rows, int cols);
    bool removeLayoutConfig(const std::string& name);
    [[nodiscard]] std::vector<std::string> availableLayouts() const;
    [[nodiscard]] std::optional<services::LayoutConfig> layoutConfig(const std::string& name) const;
    [[nodiscard]] bool isBuiltInLayout(const std::string& name) const;
    [[nodiscard]] bool canAccommodate(const std::string& name, int viewportCount) const;
    [[nodiscard]] int maxViewportCount() const;
    [[nodiscard]] bool canAddMoreViewports() const;

    // ==================== Annotation preservation ====================

    [[nodiscard]] bool hasPreservedAnnotationState() const noexcept;
    [[nodiscard]] std::optional<services::AnnotationTransitionState> preservedAnnotationState() const;

    /**
     * @brief Capture the annotation store without holding the result
     */
    [[nodiscard]] std::optional<services::AnnotationTransitionState> saveCurrentAnnotationState() const;

    /**
     * @brief Restore annotations from a previously captured state
     * @return true if every annotation was restored
     */
    bool restoreAnnotationStateFromBackup(const services::AnnotationTransitionState& state);

    /**
     * @brief Restore the preserved state now and release it
     * @return false if nothing was preserved
     */
    bool forceAnnotationStateRestoration();

    void clearPreservedAnnotationState();

    // ==================== Viewport state ====================

    /**
     * @brief Snapshot camera, properties and image of every bound region
     * @return std::nullopt if the renderer failed
     */
    [[nodiscard]] std::optional<std::vector<services::ViewportStateSnapshot>>
    captureViewportStates() const;

    /**
     * @brief Apply snapshots to the current regions by index, immediately
     * @return Number of snapshots applied
     */
    size_t applyViewportStates(const std::vector<services::ViewportStateSnapshot>& states);

    // ==================== Queries ====================

    [[nodiscard]] std::string currentLayout() const;
    [[nodiscard]] int viewportCount() const noexcept;
    [[nodiscard]] std::vector<services::Viewport> viewports() const;
    [[nodiscard]] std::optional<std::string> viewportIdAt(int index) const;
    [[nodiscard]] int indexOfViewport(const std::string& viewportId) const;
    [[nodiscard]] DisplayRegion* regionAt(int index) const;
    [[nodiscard]] int activeViewportIndex() const noexcept;
    [[nodiscard]] TransitionPhase phase() const noexcept;
    [[nodiscard]] std::uint64_t generation() const noexcept;

    /**
     * @brief Restoration tasks of the current generation still outstanding
     */
    [[nodiscard]] int pendingRestorations() const noexcept;

    void setConfig(const core::CoordinatorConfig& config);
    [[nodiscard]] const core::CoordinatorConfig& config() const noexcept;

signals:
    /**
     * @brief Emitted before the current viewports are torn down
     */
    void topologyAboutToChange();

    /**
     * @brief Emitted after the viewports of the new layout are bound
     */
    void topologyChanged();

    void layoutChanged(const QString& layoutName);

    void activeViewportChanged(int index, const QString& viewportId);

    void transitionPhaseChanged(viewport_coordinator::ui::TransitionPhase phase);

    /**
     * @brief Emitted when every deferred restoration of a transition is done
     */
    void restorationFinished();

    void annotationRemapped(const QString& annotationId, const QString& fromViewportId,
                            const QString& toViewportId);

    void annotationDropped(const QString& annotationId);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace viewport_coordinator::ui

Q_DECLARE_METATYPE(viewport_coordinator::ui::TransitionPhase)
