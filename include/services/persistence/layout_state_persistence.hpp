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
 * @file layout_state_persistence.hpp
 * @brief Named layout states and sync settings stored as JSON
 * @details Layout states are kept newest first in a single JSON array under
 *          the "viewer-layout-state" key, capped at a configurable count.
 *          Sync group definitions are kept under "viewer-sync-settings".
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/persistence/persistence_service.hpp"
#include "services/viewport/viewport_types.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viewport_coordinator::services {

/**
 * @brief One saved layout arrangement
 */
struct StoredLayoutState {
    std::string id;
    std::string name;
    std::string layoutName;
    int rows = 1;
    int cols = 1;
    int activeIndex = 0;
    std::vector<ViewportStateSnapshot> viewports;
    std::vector<SyncGroup> syncGroups;

    /// ISO-8601 UTC timestamps
    std::string createdAt;
    std::string lastUsed;
};

/**
 * @brief Stores layout states through an IPersistenceService
 */
class LayoutStatePersistence {
public:
    static constexpr const char* kLayoutStateKey = "viewer-layout-state";
    static constexpr const char* kSyncSettingsKey = "viewer-sync-settings";

    /**
     * @param persistence Backing store (must outlive this object)
     * @param maxStoredLayouts Maximum number of retained layout states (minimum 1)
     */
    explicit LayoutStatePersistence(IPersistenceService& persistence,
                                    size_t maxStoredLayouts = 10);
    ~LayoutStatePersistence();

    LayoutStatePersistence(const LayoutStatePersistence&) = delete;
    LayoutStatePersistence& operator=(const LayoutStatePersistence&) = delete;

    /**
     * @brief Save a layout state as the newest entry
     *
     * The id and both timestamps are assigned here. The oldest entries beyond
     * the cap are discarded.
     *
     * @return Assigned id
     */
    [[nodiscard]] std::expected<std::string, ViewportError> saveLayoutState(
        const std::string& name, StoredLayoutState state);

    /**
     * @brief Load a layout state and refresh its last-used timestamp
     */
    [[nodiscard]] std::optional<StoredLayoutState> loadLayoutState(const std::string& id);

    /**
     * @brief All stored states, newest first; unreadable data yields an empty list
     */
    [[nodiscard]] std::vector<StoredLayoutState> getAllStoredStates() const;

    bool deleteLayoutState(const std::string& id);

    bool clearAllStates();

    /**
     * @brief Serialize every stored state as a pretty-printed JSON array
     */
    [[nodiscard]] std::string exportLayoutStates() const;

    /**
     * @brief Merge states from a JSON array exported earlier
     *
     * Invalid entries are skipped. Imported states are placed before the
     * existing ones, then the list is capped.
     *
     * @return Number of valid imported states
     */
    [[nodiscard]] std::expected<size_t, ViewportError> importLayoutStates(const std::string& json);

    bool saveSyncSettings(const std::vector<SyncGroup>& groups);

    [[nodiscard]] std::vector<SyncGroup> loadSyncSettings() const;

    [[nodiscard]] size_t maxStoredLayouts() const noexcept;
    void setMaxStoredLayouts(size_t maxStoredLayouts);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
