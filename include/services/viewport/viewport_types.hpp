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
 * @file viewport_types.hpp
 * @brief Model types shared by the viewport coordination components
 * @details Viewport bindings, layout configurations, sync groups, state
 *          snapshots, cleanup statistics and the ViewportError value used
 *          with std::expected by every fallible operation.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/render/i_rendering_engine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class QWidget;

namespace viewport_coordinator::services {

/**
 * @brief Error information for viewport coordination operations
 */
struct ViewportError {
    enum class Code {
        Success,
        UnknownLayout,
        InvalidIndex,
        DuplicateViewport,
        UnknownViewport,
        UnknownSyncGroup,
        DuplicateSyncGroup,
        AlreadyMember,
        InvalidLayoutConfig,
        InvalidSurface,
        CapacityExceeded,
        LastViewport,
        RendererFailure,
        StatePreservation,
        PersistenceFailure
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::UnknownLayout: return "Unknown layout: " + message;
            case Code::InvalidIndex: return "Invalid index: " + message;
            case Code::DuplicateViewport: return "Duplicate viewport: " + message;
            case Code::UnknownViewport: return "Unknown viewport: " + message;
            case Code::UnknownSyncGroup: return "Unknown sync group: " + message;
            case Code::DuplicateSyncGroup: return "Duplicate sync group: " + message;
            case Code::AlreadyMember: return "Already a member: " + message;
            case Code::InvalidLayoutConfig: return "Invalid layout configuration: " + message;
            case Code::InvalidSurface: return "Invalid display surface: " + message;
            case Code::CapacityExceeded: return "Capacity exceeded: " + message;
            case Code::LastViewport: return "Cannot remove last viewport: " + message;
            case Code::RendererFailure: return "Renderer failure: " + message;
            case Code::StatePreservation: return "State preservation failed: " + message;
            case Code::PersistenceFailure: return "Persistence failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief A display region bound to the rendering engine
 */
struct Viewport {
    std::string id;
    RenderHandle binding;
    QWidget* surface = nullptr;
    ViewportKind kind = ViewportKind::Stack;
    bool isActive = false;
};

/**
 * @brief Named rows x cols grid arrangement
 */
struct LayoutConfig {
    std::string name;
    int rows = 1;
    int cols = 1;

    [[nodiscard]] int capacity() const noexcept { return rows * cols; }
    [[nodiscard]] bool isValid() const noexcept {
        return !name.empty() && rows > 0 && cols > 0;
    }
};

/**
 * @brief Kinds of view state that can be propagated within a sync group
 */
enum class SyncType {
    Pan,
    Zoom,
    WindowLevel,
    Rotation,
    Flip,
    Camera
};

using SyncTypeSet = std::set<SyncType>;

/**
 * @brief Wire name of a sync type ("pan", "zoom", "windowLevel", ...)
 */
[[nodiscard]] std::string_view syncTypeName(SyncType type) noexcept;

/**
 * @brief Parse a sync type from its wire name
 */
[[nodiscard]] std::optional<SyncType> syncTypeFromName(std::string_view name) noexcept;

/**
 * @brief Named set of viewports sharing view state
 *
 * Members are unique and kept in insertion order.
 */
struct SyncGroup {
    std::string id;
    std::vector<std::string> members;
    bool active = true;
    SyncTypeSet syncTypes;

    [[nodiscard]] bool contains(const std::string& viewportId) const;
    [[nodiscard]] bool hasType(SyncType type) const { return syncTypes.contains(type); }
};

/**
 * @brief Data carried by one propagation pass
 */
struct SyncPayload {
    std::optional<Camera> camera;
    std::optional<VoiRange> voiRange;
};

/**
 * @brief Saved per-viewport state used across layout transitions
 */
struct ViewportStateSnapshot {
    int index = 0;
    std::string viewportId;
    bool isActive = false;
    std::optional<Camera> camera;
    std::optional<ViewportProperties> properties;
    std::optional<std::string> imageId;
};

/**
 * @brief Outcome of a cleanup pass
 */
struct CleanupStats {
    std::size_t viewportsRemoved = 0;
    std::size_t listenersRemoved = 0;
    std::size_t syncGroupsRemoved = 0;
    std::size_t memoryFreedBytes = 0;
    std::vector<std::string> errors;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Rough memory estimate for the coordination state
 */
struct MemoryUsageEstimate {
    std::size_t viewportCount = 0;
    std::size_t syncGroupCount = 0;
    double estimatedMemoryMB = 0.0;
};

/**
 * @brief Handle of one renderer observer owned by a registry entry
 */
struct ListenerHandle {
    std::string viewportId;
    std::uint64_t id = 0;

    [[nodiscard]] bool isValid() const noexcept { return id != 0; }

    friend bool operator==(const ListenerHandle&, const ListenerHandle&) = default;
};

/**
 * @brief Membership of one viewport in one sync group
 */
struct SyncSubscription {
    std::string groupId;
    std::string viewportId;
    std::vector<ListenerHandle> listeners;
};

}  // namespace viewport_coordinator::services
