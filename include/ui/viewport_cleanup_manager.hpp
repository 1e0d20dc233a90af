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
 * @file viewport_cleanup_manager.hpp
 * @brief Resource reclamation for viewports, listeners and sync groups
 * @details Full cleanup tears down every sync group, listener and viewport
 *          and returns the controller to 1x1. Light cleanup only prunes
 *          orphaned sync memberships and empty groups, and is what the
 *          recurring auto-cleanup timer runs. Every step is isolated: a
 *          failure is recorded in CleanupStats::errors and the remaining
 *          steps still run.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/viewport/synchronization_engine.hpp"
#include "services/viewport/viewport_registry.hpp"
#include "services/viewport/viewport_types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <QMetaType>
#include <QObject>

namespace viewport_coordinator::ui {

class LayoutTransitionController;

class ViewportCleanupManager : public QObject {
    Q_OBJECT

public:
    /// Entries kept by cleanupHistory()
    static constexpr size_t kMaxHistoryEntries = 100;

    ViewportCleanupManager(services::ViewportRegistry& registry,
                           services::SynchronizationEngine& syncEngine,
                           LayoutTransitionController& controller,
                           QObject* parent = nullptr);
    ~ViewportCleanupManager() override;

    // Non-copyable
    ViewportCleanupManager(const ViewportCleanupManager&) = delete;
    ViewportCleanupManager& operator=(const ViewportCleanupManager&) = delete;

    /**
     * @brief Remove every sync group, listener and viewport and reset to 1x1
     */
    services::CleanupStats performFullCleanup();

    /**
     * @brief Prune memberships of missing viewports, then empty groups
     */
    services::CleanupStats performLightCleanup();

    /**
     * @brief Remove the given viewports from sync groups, registry and grid
     *
     * Unknown ids are recorded as errors.
     */
    services::CleanupStats cleanupSpecificViewports(const std::vector<std::string>& viewportIds);

    /**
     * @brief Run light cleanup every @p interval (restarts a running timer)
     */
    void scheduleAutoCleanup(std::chrono::milliseconds interval = std::chrono::minutes(5));
    void stopAutoCleanup();
    [[nodiscard]] bool isAutoCleanupScheduled() const;

    [[nodiscard]] std::vector<services::CleanupStats> cleanupHistory() const;
    void clearCleanupHistory();

    /**
     * @brief 1 MB per registered viewport plus 0.1 MB per sync group
     */
    [[nodiscard]] services::MemoryUsageEstimate getMemoryUsageEstimate() const;

signals:
    void cleanupCompleted(const viewport_coordinator::services::CleanupStats& stats);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::ui

Q_DECLARE_METATYPE(viewport_coordinator::services::CleanupStats)
