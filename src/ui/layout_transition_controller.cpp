#include "ui/layout_transition_controller.hpp"
#include "ui/display_region.hpp"
#include "services/layout/layout_command.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <algorithm>
#include <exception>
#include <format>

#include <QGridLayout>
#include <QTimer>

namespace viewport_coordinator::ui {

namespace {

constexpr const char* kFallbackLayout = "1x1";

const std::vector<services::LayoutConfig>& builtInLayouts()
{
    static const std::vector<services::LayoutConfig> layouts = {
        {"1x1", 1, 1},
        {"2x2", 2, 2},
        {"1x3", 1, 3},
        {"3x1", 3, 1},
        {"2x3", 2, 3},
        {"3x2", 3, 2},
    };
    return layouts;
}

std::string regionViewportId(int index)
{
    return std::format("viewport-{}", index);
}

services::SliceOrientation orientationForIndex(int index)
{
    switch (index) {
        case 1: return services::SliceOrientation::Sagittal;
        case 2: return services::SliceOrientation::Coronal;
        default: return services::SliceOrientation::Axial;
    }
}

} // anonymous namespace

const char* transitionPhaseName(TransitionPhase phase) noexcept
{
    switch (phase) {
        case TransitionPhase::Idle: return "Idle";
        case TransitionPhase::Saving: return "Saving";
        case TransitionPhase::Clearing: return "Clearing";
        case TransitionPhase::Rebuilding: return "Rebuilding";
        case TransitionPhase::Restoring: return "Restoring";
    }
    return "Unknown";
}

// ============================================================================
// Implementation Class
// ============================================================================

class LayoutTransitionController::Impl {
public:
    struct RegionEntry {
        DisplayRegion* region = nullptr;
        QMetaObject::Connection connection;
    };

    LayoutTransitionController* q;
    services::ViewportRegistry& registry;
    services::IAnnotationStore& annotations;
    core::CoordinatorConfig config;

    QGridLayout* grid = nullptr;
    std::vector<RegionEntry> regions;
    std::vector<services::LayoutConfig> layoutConfigs = builtInLayouts();
    std::string currentLayout;
    int activeIndex = -1;

    TransitionPhase phase = TransitionPhase::Idle;
    std::uint64_t generation = 0;
    int pendingRestorations = 0;

    // Annotation state held across a transition, tagged with the
    // generation that captured it
    std::optional<services::AnnotationTransitionState> preservedAnnotations;
    std::uint64_t preservedToken = 0;

    services::LayoutCommandStack history;

    Impl(LayoutTransitionController* owner, services::ViewportRegistry& reg,
         services::IAnnotationStore& store, const core::CoordinatorConfig& cfg)
        : q(owner), registry(reg), annotations(store), config(cfg)
        , history(std::max<size_t>(1, cfg.layoutHistoryLimit)) {}

    void setPhase(TransitionPhase next) {
        if (phase == next) return;
        phase = next;
        LOG_DEBUG(std::format("Layout transition phase: {}", transitionPhaseName(next)));
        emit q->transitionPhaseChanged(next);
    }

    [[nodiscard]] std::optional<services::LayoutConfig> findConfig(const std::string& name) const {
        auto it = std::find_if(layoutConfigs.begin(), layoutConfigs.end(),
            [&name](const services::LayoutConfig& c) { return c.name == name; });
        if (it == layoutConfigs.end()) return std::nullopt;
        return *it;
    }

    [[nodiscard]] int regionCount() const {
        return static_cast<int>(regions.size());
    }

    [[nodiscard]] int indexOf(const std::string& viewportId) const {
        for (int i = 0; i < regionCount(); ++i) {
            if (regions[i].region->viewportId() == viewportId) return i;
        }
        return -1;
    }

    [[nodiscard]] DisplayRegion* regionFor(const std::string& viewportId) const {
        int index = indexOf(viewportId);
        return index >= 0 ? regions[index].region : nullptr;
    }

    std::string nextFreeViewportId() const {
        for (int k = 0;; ++k) {
            auto id = regionViewportId(k);
            if (indexOf(id) < 0 && !registry.has(id)) return id;
        }
    }

    RegionEntry createRegion(int index, const std::string& viewportId) {
        RegionEntry entry;
        entry.region = new DisplayRegion(index, viewportId, q);
        entry.connection = QObject::connect(entry.region, &DisplayRegion::activated,
                                            q, [this](int i) { q->activateViewport(i); });
        return entry;
    }

    std::expected<services::Viewport, services::ViewportError> bindRegion(DisplayRegion* region) {
        services::ViewportOptions options;
        options.orientation = orientationForIndex(region->index());
        return registry.create(region->viewportId(), region,
                               services::ViewportKind::Stack, options);
    }

    void disposeRegion(RegionEntry& entry) {
        QObject::disconnect(entry.connection);
        registry.remove(entry.region->viewportId());
        grid->removeWidget(entry.region);
        entry.region->hide();
        entry.region->deleteLater();
    }

    void relayout() {
        int cols = 1;
        if (auto cfg = findConfig(currentLayout)) cols = cfg->cols;

        for (const auto& entry : regions) {
            grid->removeWidget(entry.region);
        }
        for (int r = 0; r < grid->rowCount(); ++r) grid->setRowStretch(r, 0);
        for (int c = 0; c < grid->columnCount(); ++c) grid->setColumnStretch(c, 0);

        for (int i = 0; i < regionCount(); ++i) {
            auto* region = regions[i].region;
            region->setIndex(i);
            grid->addWidget(region, i / cols, i % cols);
            grid->setRowStretch(i / cols, 1);
            grid->setColumnStretch(i % cols, 1);
            region->show();
        }
    }

    void clearRegions() {
        for (auto& entry : regions) {
            disposeRegion(entry);
        }
        regions.clear();
        activeIndex = -1;
    }

    void buildRegions(const services::LayoutConfig& layout) {
        for (int i = 0; i < layout.capacity(); ++i) {
            regions.push_back(createRegion(i, regionViewportId(i)));
        }
        relayout();

        for (auto& entry : regions) {
            if (auto bound = bindRegion(entry.region); !bound) {
                LOG_ERROR(std::format("Failed to bind {}: {}",
                                      entry.region->viewportId(), bound.error().toString()));
            }
        }
    }

    // Throws when the renderer fails
    std::vector<services::ViewportStateSnapshot> captureViewportStates() const {
        std::vector<services::ViewportStateSnapshot> states;
        auto& renderer = registry.renderer();
        for (int i = 0; i < regionCount(); ++i) {
            auto viewport = registry.get(regions[i].region->viewportId());
            if (!viewport) continue;

            services::ViewportStateSnapshot snapshot;
            snapshot.index = i;
            snapshot.viewportId = viewport->id;
            snapshot.isActive = (i == activeIndex);
            snapshot.camera = renderer.getCamera(viewport->binding);
            snapshot.properties = renderer.getProperties(viewport->binding);
            snapshot.imageId = renderer.currentImageId(viewport->binding);
            states.push_back(std::move(snapshot));
        }
        return states;
    }

    // Throws when the annotation store fails
    services::AnnotationTransitionState captureAnnotationState() const {
        services::AnnotationTransitionState state;
        for (const auto& [frame, tools] : annotations.getAll()) {
            for (const auto& [tool, list] : tools) {
                for (const auto& annotation : list) {
                    state.annotations.push_back(services::makeSnapshot(annotation));
                }
            }
        }
        return state;
    }

    std::vector<services::Viewport> performTransition(const services::LayoutConfig& layout,
                                                      bool preserveState) {
        const std::uint64_t gen = ++generation;
        pendingRestorations = 0;

        std::vector<services::ViewportStateSnapshot> savedStates;
        bool preserving = preserveState && !regions.empty();

        if (preserving) {
            setPhase(TransitionPhase::Saving);
            try {
                savedStates = captureViewportStates();
                auto captured = captureAnnotationState();
                if (!captured.empty()) {
                    preservedAnnotations = std::move(captured);
                    preservedToken = gen;
                }
                LOG_INFO(std::format("Saved {} viewport states before switching to {}",
                                     savedStates.size(), layout.name));
            } catch (const std::exception& e) {
                LOG_ERROR(std::format("State preservation failed, continuing without it: {}",
                                      e.what()));
                savedStates.clear();
                preserving = false;
            }
        }

        // A snapshot left by an earlier transition no longer has a restoration
        // scheduled; it stays available for the grace period only
        if (preservedAnnotations && preservedToken != gen) {
            LOG_INFO(std::format("Annotation state of transition {} carried into transition {}, "
                                 "releasing after {} ms", preservedToken, gen,
                                 config.annotationGracePeriod.count()));
            scheduleGraceClear(preservedToken);
        }

        setPhase(TransitionPhase::Clearing);
        emit q->topologyAboutToChange();
        clearRegions();

        if (!preservedAnnotations) {
            try {
                annotations.removeAll();
            } catch (const std::exception& e) {
                LOG_ERROR(std::format("Failed to clear annotations: {}", e.what()));
            }
        }

        setPhase(TransitionPhase::Rebuilding);
        currentLayout = layout.name;
        buildRegions(layout);
        if (!regions.empty()) {
            q->activateViewport(0);
        }

        emit q->topologyChanged();
        emit q->layoutChanged(QString::fromStdString(layout.name));
        LOG_INFO(std::format("Layout set to {} ({} viewports)", layout.name, regionCount()));

        const bool restoreStates = preserving && !savedStates.empty();
        const bool restoreAnnotations = preserving && preservedAnnotations.has_value();

        if (!restoreStates && !restoreAnnotations) {
            setPhase(TransitionPhase::Idle);
            return q->viewports();
        }

        setPhase(TransitionPhase::Restoring);
        if (restoreStates) {
            scheduleViewportRestore(gen, std::move(savedStates));
        }
        if (restoreAnnotations) {
            scheduleAnnotationRestore(gen, preservedToken);
        }
        return q->viewports();
    }

    void finishTask(std::uint64_t gen) {
        if (gen != generation) return;
        if (pendingRestorations > 0) --pendingRestorations;
        if (pendingRestorations == 0 && phase == TransitionPhase::Restoring) {
            setPhase(TransitionPhase::Idle);
            LOG_DEBUG(std::format("Restoration for transition {} finished", gen));
            emit q->restorationFinished();
        }
    }

    void scheduleViewportRestore(std::uint64_t gen,
                                 std::vector<services::ViewportStateSnapshot> states) {
        ++pendingRestorations;
        QTimer::singleShot(config.stateRestoreDelay, q, [this, gen, states = std::move(states)]() {
            if (gen != generation) {
                LOG_DEBUG(std::format("Skipping stale viewport restoration of transition {}", gen));
                return;
            }
            restoreViewportStates(gen, states);
            finishTask(gen);
        });
    }

    void restoreViewportStates(std::uint64_t gen,
                               std::vector<services::ViewportStateSnapshot> states) {
        std::sort(states.begin(), states.end(),
            [](const auto& a, const auto& b) { return a.index < b.index; });

        for (const auto& state : states) {
            if (state.index >= regionCount()) {
                LOG_INFO(std::format("Discarding saved state of {} (index {} beyond {} viewports)",
                                     state.viewportId, state.index, regionCount()));
                continue;
            }
            ++pendingRestorations;
            restoreSingle(gen, state, regions[state.index].region->viewportId(), 0);
        }
    }

    void restoreSingle(std::uint64_t gen, const services::ViewportStateSnapshot& state,
                       const std::string& targetId, int attempt) {
        if (gen != generation) return;

        if (!registry.has(targetId)) {
            if (attempt + 1 >= config.maxRestoreAttempts) {
                LOG_WARNING(std::format("Giving up restoring {} after {} attempts",
                                        targetId, attempt + 1));
                finishTask(gen);
                return;
            }
            QTimer::singleShot(config.restorePollInterval, q,
                [this, gen, state, targetId, attempt]() {
                    restoreSingle(gen, state, targetId, attempt + 1);
                });
            return;
        }

        applySnapshot(state, targetId);
        finishTask(gen);
    }

    void applySnapshot(const services::ViewportStateSnapshot& state, const std::string& targetId) {
        auto viewport = registry.get(targetId);
        if (!viewport) return;

        auto& renderer = registry.renderer();
        try {
            if (state.camera && state.camera->isValid()) {
                renderer.setCamera(viewport->binding, *state.camera);
            }
            if (state.properties) {
                renderer.setProperties(viewport->binding, *state.properties);
            }
        } catch (const std::exception& e) {
            LOG_ERROR(std::format("Failed to restore state of {}: {}", targetId, e.what()));
        }

        if (state.isActive) {
            int index = indexOf(targetId);
            if (index >= 0) q->activateViewport(index);
        }
        registry.render(targetId);
    }

    void scheduleAnnotationRestore(std::uint64_t gen, std::uint64_t token) {
        ++pendingRestorations;
        QTimer::singleShot(config.annotationRestoreDelay, q, [this, gen, token]() {
            if (gen != generation) {
                LOG_DEBUG(std::format("Skipping stale annotation restoration of transition {}", gen));
                return;
            }
            if (preservedAnnotations && preservedToken == token) {
                auto state = *preservedAnnotations;
                if (restoreAnnotations(state)) {
                    scheduleGraceClear(token);
                }
            }
            finishTask(gen);
        });
    }

    void scheduleGraceClear(std::uint64_t token) {
        QTimer::singleShot(config.annotationGracePeriod, q, [this, token]() {
            if (preservedAnnotations && preservedToken == token) {
                preservedAnnotations.reset();
                LOG_DEBUG("Released preserved annotation state after grace period");
            }
        });
    }

    std::optional<std::string> resolveTarget(const std::string& sourceViewportId) const {
        if (regions.empty()) return std::nullopt;

        auto layout = findConfig(currentLayout);
        if (layout && layout->capacity() == 1) {
            return regions.front().region->viewportId();
        }
        if (indexOf(sourceViewportId) >= 0) {
            return sourceViewportId;
        }
        if (config.remapPolicy == core::AnnotationRemapPolicy::FirstAvailable) {
            for (const auto& entry : regions) {
                if (registry.has(entry.region->viewportId())) {
                    return entry.region->viewportId();
                }
            }
            return regions.front().region->viewportId();
        }
        return std::nullopt;
    }

    bool tryAdd(const services::AnnotationSnapshot& snapshot, const std::string& targetId) {
        try {
            annotations.add(services::fromSnapshot(snapshot, targetId), regionFor(targetId));
            return true;
        } catch (const std::exception& e) {
            LOG_WARNING(std::format("Could not restore annotation {} on {}: {}",
                                    snapshot.annotationId, targetId, e.what()));
            return false;
        }
    }

    void notifyRemapped(const services::AnnotationSnapshot& snapshot, const std::string& targetId) {
        if (targetId == snapshot.sourceViewportId) return;
        LOG_DEBUG(std::format("Annotation {} remapped from {} to {}",
                              snapshot.annotationId, snapshot.sourceViewportId, targetId));
        emit q->annotationRemapped(QString::fromStdString(snapshot.annotationId),
                                   QString::fromStdString(snapshot.sourceViewportId),
                                   QString::fromStdString(targetId));
    }

    bool restoreAnnotation(const services::AnnotationSnapshot& snapshot) {
        auto target = resolveTarget(snapshot.sourceViewportId);
        if (target) {
            if (tryAdd(snapshot, *target)) {
                notifyRemapped(snapshot, *target);
                return true;
            }
        } else if (config.remapPolicy == core::AnnotationRemapPolicy::DropUnmatched) {
            LOG_WARNING(std::format("Dropping annotation {}: no viewport matches {}",
                                    snapshot.annotationId, snapshot.sourceViewportId));
            emit q->annotationDropped(QString::fromStdString(snapshot.annotationId));
            return true;
        }

        if (config.remapPolicy == core::AnnotationRemapPolicy::FirstAvailable) {
            for (const auto& entry : regions) {
                const auto& id = entry.region->viewportId();
                if ((target && id == *target) || !registry.has(id)) continue;
                if (tryAdd(snapshot, id)) {
                    notifyRemapped(snapshot, id);
                    return true;
                }
            }
        }

        LOG_ERROR(std::format("Failed to restore annotation {}", snapshot.annotationId));
        return false;
    }

    // Overwrites the store with the remapped snapshot
    bool restoreAnnotations(const services::AnnotationTransitionState& state) {
        try {
            annotations.removeAll();
        } catch (const std::exception& e) {
            LOG_ERROR(std::format("Failed to clear annotations before restoring: {}", e.what()));
        }

        size_t failures = 0;
        for (const auto& snapshot : state.annotations) {
            if (!restoreAnnotation(snapshot)) ++failures;
        }
        LOG_INFO(std::format("Restored {} of {} annotations",
                             state.size() - failures, state.size()));
        return failures == 0;
    }
};

// ============================================================================
// LayoutTransitionController
// ============================================================================

LayoutTransitionController::LayoutTransitionController(services::ViewportRegistry& registry,
                                                       services::IAnnotationStore& annotations,
                                                       const core::CoordinatorConfig& config,
                                                       QWidget* parent)
    : QWidget(parent)
    , impl_(std::make_unique<Impl>(this, registry, annotations, config))
{
    impl_->grid = new QGridLayout(this);
    impl_->grid->setContentsMargins(0, 0, 0, 0);
    impl_->grid->setSpacing(2);
    setMinimumSize(config.minimumSurfaceExtent, config.minimumSurfaceExtent);
}

LayoutTransitionController::~LayoutTransitionController()
{
    // Release bindings while the regions still exist
    ++impl_->generation;
    for (auto& entry : impl_->regions) {
        QObject::disconnect(entry.connection);
        impl_->registry.remove(entry.region->viewportId());
    }
}

std::vector<services::Viewport> LayoutTransitionController::setLayout(const std::string& name,
                                                                      bool preserveState)
{
    auto layout = impl_->findConfig(name);
    if (!layout) {
        LOG_WARNING(std::format("Unknown layout '{}', falling back to {}", name, kFallbackLayout));
        layout = impl_->findConfig(kFallbackLayout);
    }

    if (layout->name == impl_->currentLayout && !impl_->regions.empty()) {
        return viewports();
    }
    return impl_->performTransition(*layout, preserveState);
}

std::vector<services::Viewport> LayoutTransitionController::resetToDefaultLayout()
{
    clearPreservedAnnotationState();
    return impl_->performTransition(*impl_->findConfig(kFallbackLayout), false);
}

std::vector<services::Viewport> LayoutTransitionController::setLayoutWithHistory(
    const std::string& name, bool preserveState)
{
    std::string target = name;
    if (!impl_->findConfig(target)) {
        LOG_WARNING(std::format("Unknown layout '{}', falling back to {}", name, kFallbackLayout));
        target = kFallbackLayout;
    }

    if (impl_->currentLayout.empty()) {
        return setLayout(target, preserveState);
    }
    if (target == impl_->currentLayout) {
        return viewports();
    }

    impl_->history.execute(std::make_unique<services::LayoutSwitchCommand>(
        impl_->currentLayout, target,
        [this, preserveState](const std::string& layout) { setLayout(layout, preserveState); }));
    return viewports();
}

bool LayoutTransitionController::undoLayoutChange()
{
    if (!impl_->history.canUndo()) {
        LOG_WARNING("No layout history to undo");
        return false;
    }
    return impl_->history.undo();
}

bool LayoutTransitionController::redoLayoutChange()
{
    if (!impl_->history.canRedo()) {
        LOG_WARNING("No layout history to redo");
        return false;
    }
    return impl_->history.redo();
}

bool LayoutTransitionController::canUndo() const noexcept
{
    return impl_->history.canUndo();
}

bool LayoutTransitionController::canRedo() const noexcept
{
    return impl_->history.canRedo();
}

std::vector<std::string> LayoutTransitionController::layoutHistory() const
{
    return impl_->history.undoDescriptions();
}

bool LayoutTransitionController::activateViewport(int index)
{
    if (index < 0 || index >= impl_->regionCount()) {
        LOG_WARNING(std::format("Cannot activate viewport: invalid index {}", index));
        return false;
    }

    const auto& viewportId = impl_->regions[index].region->viewportId();
    if (impl_->registry.has(viewportId)) {
        impl_->registry.setActive(viewportId);
    }

    const bool changed = impl_->activeIndex != index;
    impl_->activeIndex = index;
    for (int i = 0; i < impl_->regionCount(); ++i) {
        impl_->regions[i].region->setActive(i == index);
    }

    if (changed) {
        emit activeViewportChanged(index, QString::fromStdString(viewportId));
    }
    return true;
}

std::optional<services::Viewport> LayoutTransitionController::addViewport(std::optional<int> position)
{
    auto layout = impl_->findConfig(impl_->currentLayout);
    if (!layout) {
        LOG_WARNING("Cannot add viewport: no current layout");
        return std::nullopt;
    }
    if (impl_->regionCount() >= layout->capacity()) {
        LOG_WARNING(std::format("Cannot add viewport: layout {} is at maximum capacity ({})",
                                layout->name, layout->capacity()));
        return std::nullopt;
    }

    const auto viewportId = impl_->nextFreeViewportId();
    const int count = impl_->regionCount();
    const int insertAt = (position && *position >= 0 && *position < count) ? *position : count;

    auto entry = impl_->createRegion(insertAt, viewportId);
    impl_->regions.insert(impl_->regions.begin() + insertAt, entry);
    if (impl_->activeIndex >= insertAt) {
        ++impl_->activeIndex;
    }
    impl_->relayout();

    auto bound = impl_->bindRegion(entry.region);
    if (!bound) {
        LOG_ERROR(std::format("Failed to add viewport {}: {}", viewportId, bound.error().toString()));
        QObject::disconnect(entry.connection);
        impl_->grid->removeWidget(entry.region);
        entry.region->hide();
        entry.region->deleteLater();
        impl_->regions.erase(impl_->regions.begin() + insertAt);
        if (impl_->activeIndex > insertAt) {
            --impl_->activeIndex;
        }
        impl_->relayout();
        return std::nullopt;
    }

    LOG_INFO(std::format("Added viewport {} at index {}", viewportId, insertAt));
    return *bound;
}

bool LayoutTransitionController::removeViewport(int index)
{
    if (index < 0 || index >= impl_->regionCount()) {
        LOG_WARNING(std::format("Cannot remove viewport: invalid index {}", index));
        return false;
    }
    if (impl_->regionCount() <= 1) {
        LOG_WARNING("Cannot remove viewport: at least one viewport must remain");
        return false;
    }

    const auto viewportId = impl_->regions[index].region->viewportId();
    const bool wasActive = (index == impl_->activeIndex);

    impl_->disposeRegion(impl_->regions[index]);
    impl_->regions.erase(impl_->regions.begin() + index);
    impl_->relayout();

    if (wasActive) {
        impl_->activeIndex = -1;
        activateViewport(std::min(index, impl_->regionCount() - 1));
    } else if (impl_->activeIndex > index) {
        --impl_->activeIndex;
    }

    LOG_INFO(std::format("Removed viewport {} at index {}", viewportId, index));
    return true;
}

bool LayoutTransitionController::removeViewportById(const std::string& viewportId)
{
    int index = impl_->indexOf(viewportId);
    if (index < 0) {
        LOG_WARNING(std::format("Cannot remove viewport: {} not found", viewportId));
        return false;
    }
    return removeViewport(index);
}

std::optional<services::Viewport> LayoutTransitionController::cloneViewport(
    int sourceIndex, std::optional<int> targetPosition)
{
    if (sourceIndex < 0 || sourceIndex >= impl_->regionCount()) {
        LOG_WARNING(std::format("Cannot clone viewport: invalid source index {}", sourceIndex));
        return std::nullopt;
    }

    const auto sourceId = impl_->regions[sourceIndex].region->viewportId();
    auto source = impl_->registry.get(sourceId);
    if (!source) {
        LOG_WARNING(std::format("Cannot clone viewport: {} is not bound", sourceId));
        return std::nullopt;
    }

    auto created = addViewport(targetPosition);
    if (!created) {
        return std::nullopt;
    }

    auto& renderer = impl_->registry.renderer();
    try {
        renderer.setCamera(created->binding, renderer.getCamera(source->binding));
        renderer.setProperties(created->binding, renderer.getProperties(source->binding));
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Error cloning state of {} into {}: {}",
                              sourceId, created->id, e.what()));
    }
    impl_->registry.render(created->id);

    LOG_INFO(std::format("Cloned viewport {} to {}", sourceId, created->id));
    return created;
}

bool LayoutTransitionController::swapViewports(int first, int second)
{
    const int count = impl_->regionCount();
    if (first < 0 || first >= count || second < 0 || second >= count || first == second) {
        LOG_WARNING(std::format("Cannot swap viewports: invalid indices {}, {}", first, second));
        return false;
    }

    std::swap(impl_->regions[first], impl_->regions[second]);
    if (impl_->activeIndex == first) {
        impl_->activeIndex = second;
    } else if (impl_->activeIndex == second) {
        impl_->activeIndex = first;
    }
    impl_->relayout();
    return true;
}

size_t LayoutTransitionController::detachInteractionHandlers()
{
    size_t detached = 0;
    for (auto& entry : impl_->regions) {
        if (entry.connection) {
            QObject::disconnect(entry.connection);
            ++detached;
        }
        entry.connection = {};
    }
    return detached;
}

std::expected<void, services::ViewportError> LayoutTransitionController::addLayoutConfig(
    const std::string& name, int rows, int cols)
{
    services::LayoutConfig layout{name, rows, cols};
    if (!layout.isValid()) {
        LOG_WARNING(std::format("Invalid layout configuration '{}' ({}x{})", name, rows, cols));
        return std::unexpected(services::ViewportError{
            services::ViewportError::Code::InvalidLayoutConfig,
            std::format("'{}' ({}x{})", name, rows, cols)});
    }
    if (isBuiltInLayout(name)) {
        return std::unexpected(services::ViewportError{
            services::ViewportError::Code::InvalidLayoutConfig,
            std::format("'{}' is a built-in layout", name)});
    }

    auto it = std::find_if(impl_->layoutConfigs.begin(), impl_->layoutConfigs.end(),
        [&name](const services::LayoutConfig& c) { return c.name == name; });
    if (it != impl_->layoutConfigs.end()) {
        *it = layout;
    } else {
        impl_->layoutConfigs.push_back(layout);
    }

    LOG_INFO(std::format("Added layout configuration {} ({}x{})", name, rows, cols));
    return {};
}

bool LayoutTransitionController::removeLayoutConfig(const std::string& name)
{
    if (isBuiltInLayout(name)) {
        LOG_WARNING(std::format("Cannot remove built-in layout {}", name));
        return false;
    }
    if (name == impl_->currentLayout) {
        LOG_WARNING(std::format("Cannot remove layout {} while it is in use", name));
        return false;
    }
    return std::erase_if(impl_->layoutConfigs,
        [&name](const services::LayoutConfig& c) { return c.name == name; }) > 0;
}

std::vector<std::string> LayoutTransitionController::availableLayouts() const
{
    std::vector<std::string> names;
    names.reserve(impl_->layoutConfigs.size());
    for (const auto& layout : impl_->layoutConfigs) {
        names.push_back(layout.name);
    }
    return names;
}

std::optional<services::LayoutConfig> LayoutTransitionController::layoutConfig(
    const std::string& name) const
{
    return impl_->findConfig(name);
}

bool LayoutTransitionController::isBuiltInLayout(const std::string& name) const
{
    const auto& seeded = builtInLayouts();
    return std::any_of(seeded.begin(), seeded.end(),
        [&name](const services::LayoutConfig& c) { return c.name == name; });
}

bool LayoutTransitionController::canAccommodate(const std::string& name, int viewportCount) const
{
    auto layout = impl_->findConfig(name);
    return layout && layout->capacity() >= viewportCount;
}

int LayoutTransitionController::maxViewportCount() const
{
    auto layout = impl_->findConfig(impl_->currentLayout);
    return layout ? layout->capacity() : 0;
}

bool LayoutTransitionController::canAddMoreViewports() const
{
    return impl_->regionCount() < maxViewportCount();
}

bool LayoutTransitionController::hasPreservedAnnotationState() const noexcept
{
    return impl_->preservedAnnotations.has_value();
}

std::optional<services::AnnotationTransitionState>
LayoutTransitionController::preservedAnnotationState() const
{
    return impl_->preservedAnnotations;
}

std::optional<services::AnnotationTransitionState>
LayoutTransitionController::saveCurrentAnnotationState() const
{
    try {
        return impl_->captureAnnotationState();
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Failed to capture annotation state: {}", e.what()));
        return std::nullopt;
    }
}

bool LayoutTransitionController::restoreAnnotationStateFromBackup(
    const services::AnnotationTransitionState& state)
{
    return impl_->restoreAnnotations(state);
}

bool LayoutTransitionController::forceAnnotationStateRestoration()
{
    if (!impl_->preservedAnnotations) {
        return false;
    }
    auto state = std::move(*impl_->preservedAnnotations);
    impl_->preservedAnnotations.reset();
    return impl_->restoreAnnotations(state);
}

void LayoutTransitionController::clearPreservedAnnotationState()
{
    if (impl_->preservedAnnotations) {
        LOG_DEBUG("Cleared preserved annotation state");
    }
    impl_->preservedAnnotations.reset();
}

std::optional<std::vector<services::ViewportStateSnapshot>>
LayoutTransitionController::captureViewportStates() const
{
    try {
        return impl_->captureViewportStates();
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Failed to capture viewport states: {}", e.what()));
        return std::nullopt;
    }
}

size_t LayoutTransitionController::applyViewportStates(
    const std::vector<services::ViewportStateSnapshot>& states)
{
    size_t applied = 0;
    for (const auto& state : states) {
        if (state.index < 0 || state.index >= impl_->regionCount()) {
            LOG_INFO(std::format("Skipping saved state of {} (index {} beyond {} viewports)",
                                 state.viewportId, state.index, impl_->regionCount()));
            continue;
        }
        const auto targetId = impl_->regions[state.index].region->viewportId();
        if (!impl_->registry.has(targetId)) {
            continue;
        }
        impl_->applySnapshot(state, targetId);
        ++applied;
    }
    return applied;
}

std::string LayoutTransitionController::currentLayout() const
{
    return impl_->currentLayout;
}

int LayoutTransitionController::viewportCount() const noexcept
{
    return static_cast<int>(impl_->regions.size());
}

std::vector<services::Viewport> LayoutTransitionController::viewports() const
{
    std::vector<services::Viewport> result;
    result.reserve(impl_->regions.size());
    for (const auto& entry : impl_->regions) {
        if (auto viewport = impl_->registry.get(entry.region->viewportId())) {
            result.push_back(*viewport);
        }
    }
    return result;
}

std::optional<std::string> LayoutTransitionController::viewportIdAt(int index) const
{
    if (index < 0 || index >= impl_->regionCount()) return std::nullopt;
    return impl_->regions[index].region->viewportId();
}

int LayoutTransitionController::indexOfViewport(const std::string& viewportId) const
{
    return impl_->indexOf(viewportId);
}

DisplayRegion* LayoutTransitionController::regionAt(int index) const
{
    if (index < 0 || index >= impl_->regionCount()) return nullptr;
    return impl_->regions[index].region;
}

int LayoutTransitionController::activeViewportIndex() const noexcept
{
    return impl_->activeIndex;
}

TransitionPhase LayoutTransitionController::phase() const noexcept
{
    return impl_->phase;
}

std::uint64_t LayoutTransitionController::generation() const noexcept
{
    return impl_->generation;
}

int LayoutTransitionController::pendingRestorations() const noexcept
{
    return impl_->pendingRestorations;
}

void LayoutTransitionController::setConfig(const core::CoordinatorConfig& config)
{
    impl_->config = config;
    impl_->history.setMaxHistorySize(std::max<size_t>(1, config.layoutHistoryLimit));
}

const core::CoordinatorConfig& LayoutTransitionController::config() const noexcept
{
    return impl_->config;
}

} // namespace viewport_coordinator::ui
