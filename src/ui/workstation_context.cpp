#include "ui/workstation_context.hpp"
#include "ui/layout_transition_controller.hpp"
#include "ui/viewport_cleanup_manager.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <algorithm>
#include <format>

namespace viewport_coordinator::ui {

// ============================================================================
// Implementation Class
// ============================================================================

class WorkstationContext::Impl {
public:
    core::CoordinatorConfig config;
    std::unique_ptr<services::ViewportRegistry> registry;
    std::unique_ptr<services::SynchronizationEngine> syncEngine;
    std::unique_ptr<LayoutTransitionController> controller;
    std::unique_ptr<ViewportCleanupManager> cleanupManager;
    std::unique_ptr<services::LayoutStatePersistence> persistence;

    // Creates groups that do not exist yet with the members that are registered
    size_t applySyncGroups(const std::vector<services::SyncGroup>& groups) {
        size_t created = 0;
        for (const auto& group : groups) {
            if (syncEngine->getSyncGroup(group.id)) {
                LOG_DEBUG(std::format("Sync group {} already exists, not restored", group.id));
                continue;
            }
            auto result = syncEngine->createSyncGroup(group.id, group.syncTypes);
            if (!result) {
                LOG_WARNING(std::format("Cannot restore sync group {}: {}",
                                        group.id, result.error().toString()));
                continue;
            }
            for (const auto& member : group.members) {
                if (!registry->has(member)) {
                    LOG_DEBUG(std::format("Skipping missing member {} of sync group {}",
                                          member, group.id));
                    continue;
                }
                auto subscription = syncEngine->addViewportToSyncGroup(group.id, member);
                if (!subscription) {
                    LOG_WARNING(std::format("Cannot add {} to sync group {}: {}", member,
                                            group.id, subscription.error().toString()));
                }
            }
            if (!group.active) {
                syncEngine->disableSyncGroup(group.id);
            }
            ++created;
        }
        return created;
    }
};

// ============================================================================
// WorkstationContext
// ============================================================================

WorkstationContext::WorkstationContext(services::IRenderingEngine& renderer,
                                       services::IAnnotationStore& annotations,
                                       services::IPersistenceService& persistence,
                                       const core::CoordinatorConfig& config)
    : impl_(std::make_unique<Impl>())
{
    impl_->config = config;
    impl_->registry = std::make_unique<services::ViewportRegistry>(
        renderer, config.minimumSurfaceExtent);
    impl_->syncEngine = std::make_unique<services::SynchronizationEngine>(*impl_->registry);
    impl_->controller = std::make_unique<LayoutTransitionController>(
        *impl_->registry, annotations, config);
    impl_->cleanupManager = std::make_unique<ViewportCleanupManager>(
        *impl_->registry, *impl_->syncEngine, *impl_->controller);
    impl_->persistence = std::make_unique<services::LayoutStatePersistence>(
        persistence, config.maxStoredLayouts);

    auto* engine = impl_->syncEngine.get();
    auto* controller = impl_->controller.get();
    QObject::connect(controller, &LayoutTransitionController::topologyAboutToChange,
                     controller, [engine]() { engine->beginTopologyChange(); });
    QObject::connect(controller, &LayoutTransitionController::topologyChanged,
                     controller, [engine]() {
                         auto restored = engine->rebuildSubscriptions();
                         LOG_DEBUG(std::format("Re-subscribed {} sync listeners", restored));
                     });

    LOG_INFO("Workstation context created");
}

WorkstationContext::~WorkstationContext()
{
    impl_->cleanupManager->stopAutoCleanup();
    impl_->cleanupManager.reset();
    // Detach from any container widget before deleting
    impl_->controller->setParent(nullptr);
    impl_->controller.reset();
    impl_->syncEngine.reset();
    impl_->registry.reset();
}

// ==================== Layout ====================

std::vector<services::Viewport> WorkstationContext::setLayout(const std::string& name,
                                                              bool preserveState)
{
    return impl_->controller->setLayout(name, preserveState);
}

bool WorkstationContext::activateViewport(int index)
{
    return impl_->controller->activateViewport(index);
}

std::optional<services::Viewport> WorkstationContext::addViewport(std::optional<int> position)
{
    return impl_->controller->addViewport(position);
}

bool WorkstationContext::removeViewport(int index)
{
    return impl_->controller->removeViewport(index);
}

std::optional<services::Viewport> WorkstationContext::cloneViewport(
    int sourceIndex, std::optional<int> targetPosition)
{
    return impl_->controller->cloneViewport(sourceIndex, targetPosition);
}

bool WorkstationContext::swapViewports(int first, int second)
{
    return impl_->controller->swapViewports(first, second);
}

std::string WorkstationContext::getCurrentLayout() const
{
    return impl_->controller->currentLayout();
}

int WorkstationContext::getViewportCount() const
{
    return impl_->controller->viewportCount();
}

// ==================== Synchronization ====================

std::expected<services::SyncGroup, services::ViewportError> WorkstationContext::createSyncGroup(
    const std::string& groupId, const services::SyncTypeSet& syncTypes)
{
    return impl_->syncEngine->createSyncGroup(groupId, syncTypes);
}

std::expected<services::SyncSubscription, services::ViewportError>
WorkstationContext::addViewportToSyncGroup(const std::string& groupId,
                                           const std::string& viewportId)
{
    return impl_->syncEngine->addViewportToSyncGroup(groupId, viewportId);
}

size_t WorkstationContext::synchronizeViewports(const std::string& sourceViewportId,
                                                services::SyncType type,
                                                const services::SyncPayload& payload)
{
    return impl_->syncEngine->synchronizeViewports(sourceViewportId, type, payload);
}

std::vector<services::SyncGroup> WorkstationContext::getAllSyncGroups() const
{
    return impl_->syncEngine->getAllSyncGroups();
}

// ==================== Cleanup ====================

services::CleanupStats WorkstationContext::performFullCleanup()
{
    return impl_->cleanupManager->performFullCleanup();
}

services::CleanupStats WorkstationContext::performLightCleanup()
{
    return impl_->cleanupManager->performLightCleanup();
}

services::CleanupStats WorkstationContext::cleanupSpecificViewports(
    const std::vector<std::string>& viewportIds)
{
    return impl_->cleanupManager->cleanupSpecificViewports(viewportIds);
}

services::MemoryUsageEstimate WorkstationContext::getMemoryUsageEstimate() const
{
    return impl_->cleanupManager->getMemoryUsageEstimate();
}

// ==================== Layout persistence ====================

std::expected<std::string, services::ViewportError> WorkstationContext::saveLayoutState(
    const std::string& name)
{
    auto& controller = *impl_->controller;
    const auto layoutName = controller.currentLayout();
    auto layout = controller.layoutConfig(layoutName);
    if (!layout) {
        return std::unexpected(services::ViewportError{
            services::ViewportError::Code::UnknownLayout,
            "No layout is set"
        });
    }

    auto states = controller.captureViewportStates();
    if (!states) {
        return std::unexpected(services::ViewportError{
            services::ViewportError::Code::StatePreservation,
            std::format("Failed to capture viewport states of layout {}", layoutName)
        });
    }

    services::StoredLayoutState state;
    state.layoutName = layout->name;
    state.rows = layout->rows;
    state.cols = layout->cols;
    state.activeIndex = std::max(controller.activeViewportIndex(), 0);
    state.viewports = std::move(*states);
    state.syncGroups = impl_->syncEngine->getAllSyncGroups();

    return impl_->persistence->saveLayoutState(name, std::move(state));
}

bool WorkstationContext::loadLayoutState(const std::string& id)
{
    auto state = impl_->persistence->loadLayoutState(id);
    if (!state) {
        LOG_WARNING(std::format("Layout state {} not found", id));
        return false;
    }

    auto& controller = *impl_->controller;
    if (!controller.layoutConfig(state->layoutName)) {
        auto added = controller.addLayoutConfig(state->layoutName, state->rows, state->cols);
        if (!added) {
            LOG_ERROR(std::format("Cannot load layout state {}: {}", id,
                                  added.error().toString()));
            return false;
        }
    }

    controller.setLayout(state->layoutName, false);
    auto applied = controller.applyViewportStates(state->viewports);
    controller.activateViewport(state->activeIndex);

    impl_->syncEngine->destroy();
    auto groups = impl_->applySyncGroups(state->syncGroups);

    LOG_INFO(std::format("Loaded layout state '{}' ({}): {} viewport states, {} sync groups",
                         state->name, state->layoutName, applied, groups));
    return true;
}

std::vector<services::StoredLayoutState> WorkstationContext::storedLayoutStates() const
{
    return impl_->persistence->getAllStoredStates();
}

bool WorkstationContext::deleteLayoutState(const std::string& id)
{
    return impl_->persistence->deleteLayoutState(id);
}

bool WorkstationContext::saveSyncSettings()
{
    return impl_->persistence->saveSyncSettings(impl_->syncEngine->getAllSyncGroups());
}

size_t WorkstationContext::loadSyncSettings()
{
    return impl_->applySyncGroups(impl_->persistence->loadSyncSettings());
}

// ==================== Components ====================

services::ViewportRegistry& WorkstationContext::registry() noexcept
{
    return *impl_->registry;
}

services::SynchronizationEngine& WorkstationContext::syncEngine() noexcept
{
    return *impl_->syncEngine;
}

LayoutTransitionController& WorkstationContext::controller() noexcept
{
    return *impl_->controller;
}

ViewportCleanupManager& WorkstationContext::cleanupManager() noexcept
{
    return *impl_->cleanupManager;
}

services::LayoutStatePersistence& WorkstationContext::layoutPersistence() noexcept
{
    return *impl_->persistence;
}

const core::CoordinatorConfig& WorkstationContext::config() const noexcept
{
    return impl_->config;
}

} // namespace viewport_coordinator::ui
