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
 * @file workstation_context.hpp
 * @brief Composition root for multi-viewport coordination
 * @details Owns the ViewportRegistry, SynchronizationEngine,
 *          LayoutTransitionController and ViewportCleanupManager, wires the
 *          controller's topology signals to the engine's re-subscription,
 *          and persists named layout states. One context is constructed at
 *          startup and passed to whatever needs it; tests create their own.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/coordinator_config.hpp"
#include "services/annotation/annotation_store.hpp"
#include "services/persistence/layout_state_persistence.hpp"
#include "services/persistence/persistence_service.hpp"
#include "services/render/i_rendering_engine.hpp"
#include "services/viewport/synchronization_engine.hpp"
#include "services/viewport/viewport_registry.hpp"
#include "services/viewport/viewport_types.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viewport_coordinator::ui {

class LayoutTransitionController;
class ViewportCleanupManager;

class WorkstationContext {
public:
    /**
     * @param renderer Rendering collaborator (must outlive the context)
     * @param annotations Annotation store (must outlive the context)
     * @param persistence Backing store for layout states (must outlive the context)
     * @param config Timing and policy configuration
     *
     * The context owns the layout controller widget. A widget the controller
     * is placed into must not be destroyed before the context.
     */
    WorkstationContext(services::IRenderingEngine& renderer,
                       services::IAnnotationStore& annotations,
                       services::IPersistenceService& persistence,
                       const core::CoordinatorConfig& config = {});
    ~WorkstationContext();

    // Non-copyable
    WorkstationContext(const WorkstationContext&) = delete;
    WorkstationContext& operator=(const WorkstationContext&) = delete;

    // ==================== Layout ====================

    std::vector<services::Viewport> setLayout(const std::string& name, bool preserveState = true);
    bool activateViewport(int index);
    std::optional<services::Viewport> addViewport(std::optional<int> position = std::nullopt);
    bool removeViewport(int index);
    std::optional<services::Viewport> cloneViewport(int sourceIndex,
                                                    std::optional<int> targetPosition = std::nullopt);
    bool swapViewports(int first, int second);

    [[nodiscard]] std::string getCurrentLayout() const;
    [[nodiscard]] int getViewportCount() const;

    // ==================== Synchronization ====================

    [[nodiscard]] std::expected<services::SyncGroup, services::ViewportError> createSyncGroup(
        const std::string& groupId, const services::SyncTypeSet& syncTypes);
    [[nodiscard]] std::expected<services::SyncSubscription, services::ViewportError>
    addViewportToSyncGroup(const std::string& groupId, const std::string& viewportId);
    size_t synchronizeViewports(const std::string& sourceViewportId, services::SyncType type,
                                const services::SyncPayload& payload);
    [[nodiscard]] std::vector<services::SyncGroup> getAllSyncGroups() const;

    // ==================== Cleanup ====================

    services::CleanupStats performFullCleanup();
    services::CleanupStats performLightCleanup();
    services::CleanupStats cleanupSpecificViewports(const std::vector<std::string>& viewportIds);
    [[nodiscard]] services::MemoryUsageEstimate getMemoryUsageEstimate() const;

    // ==================== Layout persistence ====================

    /**
     * @brief Store the current layout, viewport states and sync groups
     * @return Id of the stored state
     */
    [[nodiscard]] std::expected<std::string, services::ViewportError> saveLayoutState(
        const std::string& name);

    /**
     * @brief Switch to a stored layout and reapply its viewport states and sync groups
     */
    bool loadLayoutState(const std::string& id);

    [[nodiscard]] std::vector<services::StoredLayoutState> storedLayoutStates() const;
    bool deleteLayoutState(const std::string& id);

    bool saveSyncSettings();

    /**
     * @brief Recreate stored sync groups that do not exist yet
     * @return Number of groups created
     */
    size_t loadSyncSettings();

    // ==================== Components ====================

    [[nodiscard]] services::ViewportRegistry& registry() noexcept;
    [[nodiscard]] services::SynchronizationEngine& syncEngine() noexcept;

    [[nodiscard]] LayoutTransitionController& controller() noexcept;
    [[nodiscard]] ViewportCleanupManager& cleanupManager() noexcept;
    [[nodiscard]] services::LayoutStatePersistence& layoutPersistence() noexcept;
    [[nodiscard]] const core::CoordinatorConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::ui
