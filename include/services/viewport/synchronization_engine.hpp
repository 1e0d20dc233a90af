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
 * @file synchronization_engine.hpp
 * @brief Sync groups and propagation of view state between viewports
 * @details A sync group names a set of viewports and the kinds of view state
 *          (pan, zoom, window/level, rotation, flip, camera) shared between
 *          them. Membership attaches renderer observers through the
 *          ViewportRegistry so that a change in one member is pushed to the
 *          others. A single propagation guard drops changes that arrive
 *          while a propagation pass is already running, which breaks the
 *          feedback loop caused by targets reporting their own updates.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/viewport/viewport_registry.hpp"
#include "services/viewport/viewport_types.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viewport_coordinator::services {

/**
 * @brief Manages sync groups over the viewports of a registry
 *
 * Group membership always refers to viewports known to the registry, except
 * between beginTopologyChange() and rebuildSubscriptions() while a layout
 * is being rebuilt.
 */
class SynchronizationEngine {
public:
    static constexpr const char* kDefaultSyncGroupId = "default-sync-group";

    /**
     * @brief Construct over a registry
     * @param registry Viewport registry (must outlive the engine)
     *
     * Installs the registry's removal callback.
     */
    explicit SynchronizationEngine(ViewportRegistry& registry);
    ~SynchronizationEngine();

    // Non-copyable
    SynchronizationEngine(const SynchronizationEngine&) = delete;
    SynchronizationEngine& operator=(const SynchronizationEngine&) = delete;

    /**
     * @brief Create a sync group and open its propagation channels
     *
     * A camera channel "<id>-camera" is opened when camera, pan or zoom is
     * enabled; a VOI channel "<id>-voi" when windowLevel is enabled. Pan,
     * zoom and camera changes reach the viewports attached to the camera
     * channel, window/level changes those attached to the VOI channel.
     * Rotation and flip reach every group member.
     */
    [[nodiscard]] std::expected<SyncGroup, ViewportError> createSyncGroup(
        const std::string& groupId, const SyncTypeSet& syncTypes = {});

    /**
     * @brief Add a viewport to a group and subscribe to its changes
     * @return Subscription holding one listener per enabled sync type
     */
    [[nodiscard]] std::expected<SyncSubscription, ViewportError> addViewportToSyncGroup(
        const std::string& groupId, const std::string& viewportId);

    bool removeViewportFromSyncGroup(const std::string& groupId, const std::string& viewportId);

    bool removeSyncGroup(const std::string& groupId);

    bool enableSyncGroup(const std::string& groupId);
    bool disableSyncGroup(const std::string& groupId);

    /**
     * @brief Enable more sync types; listeners and channels are rebuilt
     */
    bool addSyncTypes(const std::string& groupId, const SyncTypeSet& syncTypes);

    /**
     * @brief Disable sync types; listeners and channels are rebuilt
     */
    bool removeSyncTypes(const std::string& groupId, const SyncTypeSet& syncTypes);

    /**
     * @brief Push view state from one viewport to the members of its groups
     *
     * Calls made while a pass is in progress are dropped. A failure to
     * update one target is logged and does not stop the pass.
     *
     * @param sourceViewportId Viewport the change originated in
     * @param type Kind of state to propagate
     * @param payload Camera and/or VOI range to apply
     * @return Number of target viewports updated
     */
    size_t synchronizeViewports(const std::string& sourceViewportId, SyncType type,
                                const SyncPayload& payload);

    /**
     * @brief Recreate the default group with every registered viewport
     * @return Id of the default group
     */
    std::string createDefaultSyncGroup(
        const SyncTypeSet& syncTypes = {SyncType::Pan, SyncType::Zoom, SyncType::WindowLevel});

    [[nodiscard]] std::vector<SyncGroup> getAllSyncGroups() const;
    [[nodiscard]] std::optional<SyncGroup> getSyncGroup(const std::string& groupId) const;
    [[nodiscard]] std::vector<std::string> getViewportSyncGroups(const std::string& viewportId) const;
    [[nodiscard]] size_t syncGroupCount() const noexcept;

    /**
     * @brief Number of registry listeners owned by a group
     */
    [[nodiscard]] size_t listenerCount(const std::string& groupId) const;

    /**
     * @brief Open propagation channel ids of a group
     */
    [[nodiscard]] std::vector<std::string> channels(const std::string& groupId) const;

    /**
     * @brief Viewports attached to a propagation channel
     */
    [[nodiscard]] std::vector<std::string> channelMembers(const std::string& channelId) const;

    /**
     * @brief Re-attach a group member to one of the group's channels
     * @return false if the channel is closed, the viewport is not a member
     *         of the owning group, or it is already attached
     */
    bool addViewportToChannel(const std::string& channelId, const std::string& viewportId);

    /**
     * @brief Stop a viewport receiving the changes a channel carries
     *
     * Group membership and listeners are kept; the viewport still sends.
     */
    bool removeViewportFromChannel(const std::string& channelId, const std::string& viewportId);

    [[nodiscard]] bool isProcessingSync() const noexcept;

    /**
     * @brief Suspend membership pruning while viewports are torn down
     */
    void beginTopologyChange();

    /**
     * @brief End a topology change and resubscribe surviving members
     *
     * Members that exist in the registry get fresh listeners, the others are
     * pruned.
     *
     * @return Number of members resubscribed
     */
    size_t rebuildSubscriptions();

    [[nodiscard]] bool isTopologyChanging() const noexcept;

    /**
     * @brief Remove memberships that refer to unknown viewports
     * @return Number of memberships removed
     */
    size_t pruneMissingViewports();

    /**
     * @brief Remove groups without members
     * @return Number of groups removed
     */
    size_t removeEmptyGroups();

    /**
     * @brief Remove every group
     * @return Number of groups removed
     */
    size_t destroy();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
