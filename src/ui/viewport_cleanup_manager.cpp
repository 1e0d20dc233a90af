#include "ui/viewport_cleanup_manager.hpp"
#include "ui/layout_transition_controller.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <exception>
#include <format>

#include <QTimer>

namespace viewport_coordinator::ui {

namespace {

// Bookkeeping released per viewport entry (binding, listeners, region)
constexpr size_t kBytesPerViewport = 1024;

constexpr double kMegabytesPerViewport = 1.0;
constexpr double kMegabytesPerSyncGroup = 0.1;

} // anonymous namespace

// ============================================================================
// Implementation Class
// ============================================================================

class ViewportCleanupManager::Impl {
public:
    services::ViewportRegistry& registry;
    services::SynchronizationEngine& syncEngine;
    LayoutTransitionController& controller;

    QTimer autoCleanupTimer;
    std::vector<services::CleanupStats> history;

    Impl(services::ViewportRegistry& reg, services::SynchronizationEngine& sync,
         LayoutTransitionController& ctrl)
        : registry(reg), syncEngine(sync), controller(ctrl)
    {
        autoCleanupTimer.setSingleShot(false);
    }

    template <typename Step>
    void runStep(services::CleanupStats& stats, const char* name, Step&& step)
    {
        try {
            step();
        } catch (const std::exception& e) {
            stats.errors.push_back(std::format("{}: {}", name, e.what()));
            LOG_ERROR(std::format("Cleanup step '{}' failed: {}", name, e.what()));
        }
    }

    void record(const services::CleanupStats& stats)
    {
        history.push_back(stats);
        if (history.size() > kMaxHistoryEntries) {
            history.erase(history.begin(),
                          history.begin() + static_cast<std::ptrdiff_t>(history.size() - kMaxHistoryEntries));
        }
    }
};

// ============================================================================
// ViewportCleanupManager
// ============================================================================

ViewportCleanupManager::ViewportCleanupManager(services::ViewportRegistry& registry,
                                               services::SynchronizationEngine& syncEngine,
                                               LayoutTransitionController& controller,
                                               QObject* parent)
    : QObject(parent)
    , impl_(std::make_unique<Impl>(registry, syncEngine, controller))
{
    qRegisterMetaType<services::CleanupStats>("viewport_coordinator::services::CleanupStats");

    connect(&impl_->autoCleanupTimer, &QTimer::timeout, this, [this]() {
        auto stats = performLightCleanup();
        LOG_DEBUG(std::format("Auto cleanup: {} sync groups removed", stats.syncGroupsRemoved));
    });
}

ViewportCleanupManager::~ViewportCleanupManager()
{
    impl_->autoCleanupTimer.stop();
}

services::CleanupStats ViewportCleanupManager::performFullCleanup()
{
    LOG_INFO("Starting full viewport cleanup");
    services::CleanupStats stats;

    impl_->runStep(stats, "sync groups", [&]() {
        for (const auto& group : impl_->syncEngine.getAllSyncGroups()) {
            const auto listeners = impl_->syncEngine.listenerCount(group.id);
            if (impl_->syncEngine.removeSyncGroup(group.id)) {
                stats.listenersRemoved += listeners;
                ++stats.syncGroupsRemoved;
            }
        }
    });

    impl_->runStep(stats, "listeners", [&]() {
        for (const auto& id : impl_->registry.allIds()) {
            stats.listenersRemoved += impl_->registry.detachAllListeners(id);
        }
        stats.listenersRemoved += impl_->controller.detachInteractionHandlers();
    });

    impl_->runStep(stats, "viewports", [&]() {
        for (const auto& id : impl_->registry.allIds()) {
            if (impl_->registry.remove(id)) {
                ++stats.viewportsRemoved;
                stats.memoryFreedBytes += kBytesPerViewport;
            }
        }
    });

    impl_->runStep(stats, "layout reset", [&]() {
        impl_->controller.resetToDefaultLayout();
    });

    impl_->runStep(stats, "render cache", [&]() {
        if (auto released = impl_->registry.renderer().purgeCache()) {
            stats.memoryFreedBytes += *released;
        }
    });

    stats.timestamp = std::chrono::system_clock::now();
    impl_->record(stats);

    LOG_INFO(std::format("Full cleanup finished: {} viewports, {} listeners, {} sync groups, "
                         "{} bytes, {} errors",
                         stats.viewportsRemoved, stats.listenersRemoved,
                         stats.syncGroupsRemoved, stats.memoryFreedBytes, stats.errors.size()));
    emit cleanupCompleted(stats);
    return stats;
}

services::CleanupStats ViewportCleanupManager::performLightCleanup()
{
    services::CleanupStats stats;

    impl_->runStep(stats, "orphaned memberships", [&]() {
        impl_->syncEngine.pruneMissingViewports();
    });

    impl_->runStep(stats, "empty sync groups", [&]() {
        stats.syncGroupsRemoved += impl_->syncEngine.removeEmptyGroups();
    });

    stats.timestamp = std::chrono::system_clock::now();
    impl_->record(stats);

    LOG_DEBUG(std::format("Light cleanup finished: {} sync groups removed",
                          stats.syncGroupsRemoved));
    emit cleanupCompleted(stats);
    return stats;
}

services::CleanupStats ViewportCleanupManager::cleanupSpecificViewports(
    const std::vector<std::string>& viewportIds)
{
    services::CleanupStats stats;

    for (const auto& id : viewportIds) {
        if (!impl_->registry.has(id)) {
            stats.errors.push_back(std::format("Viewport {} not found", id));
            LOG_WARNING(std::format("Cannot clean up viewport {}: not registered", id));
            continue;
        }
        const bool hasRegion = impl_->controller.indexOfViewport(id) >= 0;
        if (hasRegion && impl_->controller.viewportCount() <= 1) {
            stats.errors.push_back(std::format("Viewport {} is the last display region", id));
            LOG_WARNING(std::format("Cannot clean up viewport {}: it is the last display region",
                                    id));
            continue;
        }

        impl_->runStep(stats, "sync membership", [&]() {
            const auto before = impl_->registry.listenerCount(id);
            for (const auto& groupId : impl_->syncEngine.getViewportSyncGroups(id)) {
                impl_->syncEngine.removeViewportFromSyncGroup(groupId, id);
            }
            stats.listenersRemoved += before - impl_->registry.listenerCount(id);
        });

        impl_->runStep(stats, "listeners", [&]() {
            stats.listenersRemoved += impl_->registry.detachAllListeners(id);
        });

        impl_->runStep(stats, "registry", [&]() {
            if (impl_->registry.remove(id)) {
                ++stats.viewportsRemoved;
                stats.memoryFreedBytes += kBytesPerViewport;
            }
        });

        if (hasRegion) {
            impl_->runStep(stats, "display region", [&]() {
                if (!impl_->controller.removeViewportById(id)) {
                    stats.errors.push_back(
                        std::format("display region: viewport {} could not be removed", id));
                    LOG_ERROR(std::format("Failed to remove display region of viewport {}", id));
                }
            });
        }
    }

    stats.timestamp = std::chrono::system_clock::now();
    impl_->record(stats);

    LOG_INFO(std::format("Cleaned up {} of {} viewports", stats.viewportsRemoved,
                         viewportIds.size()));
    emit cleanupCompleted(stats);
    return stats;
}

void ViewportCleanupManager::scheduleAutoCleanup(std::chrono::milliseconds interval)
{
    if (interval.count() <= 0) {
        LOG_WARNING(std::format("Ignoring auto cleanup interval of {} ms", interval.count()));
        return;
    }
    impl_->autoCleanupTimer.start(interval);
    LOG_INFO(std::format("Auto cleanup scheduled every {} ms", interval.count()));
}

void ViewportCleanupManager::stopAutoCleanup()
{
    if (impl_->autoCleanupTimer.isActive()) {
        impl_->autoCleanupTimer.stop();
        LOG_INFO("Auto cleanup stopped");
    }
}

bool ViewportCleanupManager::isAutoCleanupScheduled() const
{
    return impl_->autoCleanupTimer.isActive();
}

std::vector<services::CleanupStats> ViewportCleanupManager::cleanupHistory() const
{
    return impl_->history;
}

void ViewportCleanupManager::clearCleanupHistory()
{
    impl_->history.clear();
}

services::MemoryUsageEstimate ViewportCleanupManager::getMemoryUsageEstimate() const
{
    services::MemoryUsageEstimate estimate;
    estimate.viewportCount = impl_->registry.count();
    estimate.syncGroupCount = impl_->syncEngine.syncGroupCount();
    estimate.estimatedMemoryMB =
        static_cast<double>(estimate.viewportCount) * kMegabytesPerViewport
        + static_cast<double>(estimate.syncGroupCount) * kMegabytesPerSyncGroup;
    return estimate;
}

} // namespace viewport_coordinator::ui
