#include "services/viewport/synchronization_engine.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <map>
#include <optional>
#include <set>

namespace viewport_coordinator::services {

namespace {

std::string listenerTag(const std::string& groupId)
{
    return "sync:" + groupId;
}

std::string describeTypes(const SyncTypeSet& types)
{
    std::string result;
    for (auto type : types) {
        if (!result.empty()) {
            result += ", ";
        }
        result += syncTypeName(type);
    }
    return result;
}

// Channel suffix carrying a sync type; rotation and flip travel over membership
std::optional<std::string> channelSuffixFor(SyncType type)
{
    switch (type) {
        case SyncType::Camera:
        case SyncType::Pan:
        case SyncType::Zoom:
            return std::string("-camera");
        case SyncType::WindowLevel:
            return std::string("-voi");
        case SyncType::Rotation:
        case SyncType::Flip:
            break;
    }
    return std::nullopt;
}

RenderEvent eventFor(SyncType type)
{
    return type == SyncType::WindowLevel ? RenderEvent::VoiModified
                                         : RenderEvent::CameraModified;
}

} // anonymous namespace

// ============================================================================
// Implementation Class
// ============================================================================

class SynchronizationEngine::Impl {
public:
    ViewportRegistry& registry_;

    // Insertion-ordered groups
    std::vector<SyncGroup> groups_;

    // channel id -> attached viewport ids
    std::map<std::string, std::vector<std::string>> channels_;

    bool processingSync_ = false;
    bool topologyChanging_ = false;

    explicit Impl(ViewportRegistry& registry) : registry_(registry) {}

    /// Clears the propagation flag when a pass ends, including by exception
    class PropagationGuard {
    public:
        explicit PropagationGuard(bool& flag) : flag_(flag) { flag_ = true; }
        ~PropagationGuard() { flag_ = false; }
        PropagationGuard(const PropagationGuard&) = delete;
        PropagationGuard& operator=(const PropagationGuard&) = delete;
    private:
        bool& flag_;
    };

    SyncGroup* findGroup(const std::string& id) {
        auto it = std::find_if(groups_.begin(), groups_.end(),
            [&id](const SyncGroup& g) { return g.id == id; });
        return it != groups_.end() ? &*it : nullptr;
    }

    const SyncGroup* findGroup(const std::string& id) const {
        auto it = std::find_if(groups_.begin(), groups_.end(),
            [&id](const SyncGroup& g) { return g.id == id; });
        return it != groups_.end() ? &*it : nullptr;
    }

    static std::vector<std::string> channelIdsFor(const SyncGroup& group) {
        std::vector<std::string> ids;
        if (group.hasType(SyncType::Camera) || group.hasType(SyncType::Pan)
            || group.hasType(SyncType::Zoom)) {
            ids.push_back(group.id + "-camera");
        }
        if (group.hasType(SyncType::WindowLevel)) {
            ids.push_back(group.id + "-voi");
        }
        return ids;
    }

    void closeChannels(const std::string& groupId) {
        std::erase_if(channels_, [&groupId](const auto& entry) {
            return entry.first == groupId + "-camera" || entry.first == groupId + "-voi";
        });
    }

    void openChannels(const SyncGroup& group) {
        closeChannels(group.id);
        for (const auto& channelId : channelIdsFor(group)) {
            channels_[channelId] = group.members;
            LOG_DEBUG(std::format("Opened channel {}", channelId));
        }
    }

    void addToChannels(const SyncGroup& group, const std::string& viewportId) {
        for (const auto& channelId : channelIdsFor(group)) {
            auto& members = channels_[channelId];
            if (std::find(members.begin(), members.end(), viewportId) == members.end()) {
                members.push_back(viewportId);
            }
        }
    }

    void removeFromChannels(const std::string& groupId, const std::string& viewportId) {
        for (const auto& suffix : {"-camera", "-voi"}) {
            auto it = channels_.find(groupId + suffix);
            if (it != channels_.end()) {
                std::erase(it->second, viewportId);
            }
        }
    }

    std::vector<ListenerHandle> attachListeners(const SyncGroup& group,
                                                const std::string& viewportId) {
        std::vector<ListenerHandle> handles;
        const auto tag = listenerTag(group.id);
        for (auto type : group.syncTypes) {
            auto handle = registry_.attachListener(
                viewportId, eventFor(type),
                [this, type](const std::string& sourceId, RenderEvent) {
                    onSourceChanged(sourceId, type);
                },
                tag);
            if (handle) {
                handles.push_back(*handle);
            } else {
                LOG_WARNING(std::format("Could not attach {} listener to {} for group {}",
                                        syncTypeName(type), viewportId, group.id));
            }
        }
        return handles;
    }

    void reattachListeners(const SyncGroup& group) {
        for (const auto& member : group.members) {
            registry_.detachListeners(member, listenerTag(group.id));
            attachListeners(group, member);
        }
    }

    void onSourceChanged(const std::string& sourceId, SyncType type) {
        if (processingSync_) {
            return;
        }
        auto viewport = registry_.get(sourceId);
        if (!viewport) {
            return;
        }

        SyncPayload payload;
        try {
            if (type == SyncType::WindowLevel) {
                payload.voiRange = registry_.renderer().getProperties(viewport->binding).voiRange;
                if (!payload.voiRange) {
                    return;
                }
            } else {
                payload.camera = registry_.renderer().getCamera(viewport->binding);
            }
        } catch (const std::exception& e) {
            LOG_ERROR(std::format("Failed to read {} state of {}: {}",
                                  syncTypeName(type), sourceId, e.what()));
            return;
        }

        propagate(sourceId, type, payload);
    }

    bool applyToTarget(const std::string& targetId, SyncType type, const SyncPayload& payload) {
        auto viewport = registry_.get(targetId);
        if (!viewport) {
            LOG_WARNING(std::format("Cannot sync: viewport {} not found", targetId));
            return false;
        }

        auto& renderer = registry_.renderer();
        try {
            if (type == SyncType::WindowLevel) {
                if (!payload.voiRange) {
                    return false;
                }
                auto properties = renderer.getProperties(viewport->binding);
                properties.voiRange = payload.voiRange;
                renderer.setProperties(viewport->binding, properties);
            } else {
                if (!payload.camera) {
                    return false;
                }
                const auto& source = *payload.camera;
                auto camera = renderer.getCamera(viewport->binding);
                switch (type) {
                    case SyncType::Pan:
                        camera.position = source.position;
                        camera.focalPoint = source.focalPoint;
                        break;
                    case SyncType::Zoom:
                        camera.parallelScale = source.parallelScale;
                        camera.viewAngle = source.viewAngle;
                        break;
                    case SyncType::Rotation:
                        camera.viewUp = source.viewUp;
                        break;
                    case SyncType::Flip:
                        camera.flipHorizontal = source.flipHorizontal;
                        camera.flipVertical = source.flipVertical;
                        break;
                    case SyncType::Camera:
                    case SyncType::WindowLevel:
                        camera = source;
                        break;
                }
                renderer.setCamera(viewport->binding, camera);
            }
            renderer.render(viewport->binding);
        } catch (const std::exception& e) {
            LOG_ERROR(std::format("Error applying {} sync to viewport {}: {}",
                                  syncTypeName(type), targetId, e.what()));
            return false;
        }
        return true;
    }

    // Viewports attached to the channel that carries this type
    std::vector<std::string> recipientsOf(const SyncGroup& group, SyncType type) const {
        const auto suffix = channelSuffixFor(type);
        if (!suffix) {
            return group.members;
        }
        auto it = channels_.find(group.id + *suffix);
        return it != channels_.end() ? it->second : std::vector<std::string>{};
    }

    size_t propagate(const std::string& sourceId, SyncType type, const SyncPayload& payload) {
        if (processingSync_) {
            return 0;
        }
        PropagationGuard guard(processingSync_);

        // Snapshot targets first; applying may re-enter through observers
        std::vector<std::string> targets;
        for (const auto& group : groups_) {
            if (!group.active || !group.hasType(type) || !group.contains(sourceId)) {
                continue;
            }
            for (const auto& member : recipientsOf(group, type)) {
                if (member != sourceId
                    && std::find(targets.begin(), targets.end(), member) == targets.end()) {
                    targets.push_back(member);
                }
            }
        }

        size_t updated = 0;
        for (const auto& target : targets) {
            if (applyToTarget(target, type, payload)) {
                ++updated;
            }
        }
        return updated;
    }

    // Removes a membership; listeners are detached when the viewport still exists
    bool removeMember(SyncGroup& group, const std::string& viewportId) {
        auto it = std::find(group.members.begin(), group.members.end(), viewportId);
        if (it == group.members.end()) {
            return false;
        }
        group.members.erase(it);
        registry_.detachListeners(viewportId, listenerTag(group.id));
        removeFromChannels(group.id, viewportId);
        return true;
    }

    void pruneViewport(const std::string& viewportId) {
        for (auto& group : groups_) {
            if (removeMember(group, viewportId)) {
                LOG_DEBUG(std::format("Pruned removed viewport {} from sync group {}",
                                      viewportId, group.id));
            }
        }
    }

    void detachEverything() {
        for (const auto& group : groups_) {
            for (const auto& member : group.members) {
                registry_.detachListeners(member, listenerTag(group.id));
            }
        }
    }
};

// ============================================================================
// SynchronizationEngine
// ============================================================================

SynchronizationEngine::SynchronizationEngine(ViewportRegistry& registry)
    : impl_(std::make_unique<Impl>(registry))
{
    impl_->registry_.setRemovalCallback([this](const std::string& viewportId) {
        if (impl_->topologyChanging_) {
            return;
        }
        impl_->pruneViewport(viewportId);
    });
}

SynchronizationEngine::~SynchronizationEngine()
{
    impl_->registry_.setRemovalCallback(nullptr);
    impl_->detachEverything();
}

std::expected<SyncGroup, ViewportError> SynchronizationEngine::createSyncGroup(
    const std::string& groupId, const SyncTypeSet& syncTypes)
{
    if (groupId.empty()) {
        LOG_ERROR("Cannot create sync group with empty id");
        return std::unexpected(ViewportError{
            ViewportError::Code::UnknownSyncGroup, "empty sync group id"});
    }
    if (impl_->findGroup(groupId)) {
        LOG_WARNING(std::format("Sync group {} already exists", groupId));
        return std::unexpected(ViewportError{
            ViewportError::Code::DuplicateSyncGroup, groupId});
    }

    SyncGroup group;
    group.id = groupId;
    group.active = true;
    group.syncTypes = syncTypes;

    impl_->openChannels(group);
    impl_->groups_.push_back(group);

    LOG_INFO(std::format("Created sync group {} with types [{}]",
                         groupId, describeTypes(syncTypes)));
    return group;
}

std::expected<SyncSubscription, ViewportError> SynchronizationEngine::addViewportToSyncGroup(
    const std::string& groupId, const std::string& viewportId)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return std::unexpected(ViewportError{ViewportError::Code::UnknownSyncGroup, groupId});
    }
    if (!impl_->registry_.has(viewportId)) {
        LOG_WARNING(std::format("Viewport {} not found in registry", viewportId));
        return std::unexpected(ViewportError{ViewportError::Code::UnknownViewport, viewportId});
    }
    if (group->contains(viewportId)) {
        LOG_WARNING(std::format("Viewport {} already in sync group {}", viewportId, groupId));
        return std::unexpected(ViewportError{
            ViewportError::Code::AlreadyMember, std::format("{} in {}", viewportId, groupId)});
    }

    group->members.push_back(viewportId);
    impl_->addToChannels(*group, viewportId);

    SyncSubscription subscription;
    subscription.groupId = groupId;
    subscription.viewportId = viewportId;
    subscription.listeners = impl_->attachListeners(*group, viewportId);

    LOG_DEBUG(std::format("Added viewport {} to sync group {} ({} listeners)",
                          viewportId, groupId, subscription.listeners.size()));
    return subscription;
}

bool SynchronizationEngine::removeViewportFromSyncGroup(const std::string& groupId,
                                                        const std::string& viewportId)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }
    if (!impl_->removeMember(*group, viewportId)) {
        LOG_WARNING(std::format("Viewport {} not found in sync group {}", viewportId, groupId));
        return false;
    }
    LOG_DEBUG(std::format("Removed viewport {} from sync group {}", viewportId, groupId));
    return true;
}

bool SynchronizationEngine::removeSyncGroup(const std::string& groupId)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }

    for (const auto& member : group->members) {
        impl_->registry_.detachListeners(member, listenerTag(groupId));
    }
    impl_->closeChannels(groupId);
    std::erase_if(impl_->groups_, [&groupId](const SyncGroup& g) { return g.id == groupId; });

    LOG_INFO(std::format("Removed sync group {}", groupId));
    return true;
}

bool SynchronizationEngine::enableSyncGroup(const std::string& groupId)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }
    group->active = true;
    return true;
}

bool SynchronizationEngine::disableSyncGroup(const std::string& groupId)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }
    group->active = false;
    return true;
}

bool SynchronizationEngine::addSyncTypes(const std::string& groupId, const SyncTypeSet& syncTypes)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }
    group->syncTypes.insert(syncTypes.begin(), syncTypes.end());
    impl_->openChannels(*group);
    impl_->reattachListeners(*group);

    LOG_INFO(std::format("Added sync types [{}] to group {}", describeTypes(syncTypes), groupId));
    return true;
}

bool SynchronizationEngine::removeSyncTypes(const std::string& groupId,
                                            const SyncTypeSet& syncTypes)
{
    auto* group = impl_->findGroup(groupId);
    if (!group) {
        LOG_WARNING(std::format("Sync group {} not found", groupId));
        return false;
    }
    for (auto type : syncTypes) {
        group->syncTypes.erase(type);
    }
    impl_->openChannels(*group);
    impl_->reattachListeners(*group);

    LOG_INFO(std::format("Removed sync types [{}] from group {}",
                         describeTypes(syncTypes), groupId));
    return true;
}

size_t SynchronizationEngine::synchronizeViewports(const std::string& sourceViewportId,
                                                   SyncType type, const SyncPayload& payload)
{
    if (impl_->processingSync_) {
        LOG_DEBUG(std::format("Dropping {} sync from {}: propagation in progress",
                              syncTypeName(type), sourceViewportId));
        return 0;
    }
    return impl_->propagate(sourceViewportId, type, payload);
}

std::string SynchronizationEngine::createDefaultSyncGroup(const SyncTypeSet& syncTypes)
{
    const std::string groupId = kDefaultSyncGroupId;
    if (impl_->findGroup(groupId)) {
        removeSyncGroup(groupId);
    }

    if (auto created = createSyncGroup(groupId, syncTypes); !created) {
        LOG_ERROR(std::format("Failed to create default sync group: {}",
                              created.error().toString()));
        return groupId;
    }

    const auto ids = impl_->registry_.allIds();
    for (const auto& viewportId : ids) {
        if (auto added = addViewportToSyncGroup(groupId, viewportId); !added) {
            LOG_WARNING(added.error().toString());
        }
    }

    LOG_INFO(std::format("Created default sync group with {} viewports", ids.size()));
    return groupId;
}

std::vector<SyncGroup> SynchronizationEngine::getAllSyncGroups() const
{
    return impl_->groups_;
}

std::optional<SyncGroup> SynchronizationEngine::getSyncGroup(const std::string& groupId) const
{
    if (const auto* group = impl_->findGroup(groupId)) {
        return *group;
    }
    return std::nullopt;
}

std::vector<std::string> SynchronizationEngine::getViewportSyncGroups(
    const std::string& viewportId) const
{
    std::vector<std::string> result;
    for (const auto& group : impl_->groups_) {
        if (group.contains(viewportId)) {
            result.push_back(group.id);
        }
    }
    return result;
}

size_t SynchronizationEngine::syncGroupCount() const noexcept
{
    return impl_->groups_.size();
}

size_t SynchronizationEngine::listenerCount(const std::string& groupId) const
{
    const auto* group = impl_->findGroup(groupId);
    if (!group) {
        return 0;
    }
    size_t total = 0;
    for (const auto& member : group->members) {
        total += impl_->registry_.listenerCount(member, listenerTag(groupId));
    }
    return total;
}

std::vector<std::string> SynchronizationEngine::channels(const std::string& groupId) const
{
    std::vector<std::string> result;
    for (const auto& [channelId, members] : impl_->channels_) {
        if (channelId == groupId + "-camera" || channelId == groupId + "-voi") {
            result.push_back(channelId);
        }
    }
    return result;
}

std::vector<std::string> SynchronizationEngine::channelMembers(const std::string& channelId) const
{
    auto it = impl_->channels_.find(channelId);
    return it != impl_->channels_.end() ? it->second : std::vector<std::string>{};
}

bool SynchronizationEngine::addViewportToChannel(const std::string& channelId,
                                                 const std::string& viewportId)
{
    auto it = impl_->channels_.find(channelId);
    if (it == impl_->channels_.end()) {
        LOG_WARNING(std::format("Channel {} is not open", channelId));
        return false;
    }
    const auto* group = impl_->findGroup(channelId.substr(0, channelId.rfind('-')));
    if (!group || !group->contains(viewportId)) {
        LOG_WARNING(std::format("Viewport {} is not a member of the group owning {}",
                                viewportId, channelId));
        return false;
    }
    auto& members = it->second;
    if (std::find(members.begin(), members.end(), viewportId) != members.end()) {
        return false;
    }
    members.push_back(viewportId);
    LOG_DEBUG(std::format("Viewport {} joined channel {}", viewportId, channelId));
    return true;
}

bool SynchronizationEngine::removeViewportFromChannel(const std::string& channelId,
                                                      const std::string& viewportId)
{
    auto it = impl_->channels_.find(channelId);
    if (it == impl_->channels_.end() || std::erase(it->second, viewportId) == 0) {
        LOG_WARNING(std::format("Viewport {} is not attached to channel {}",
                                viewportId, channelId));
        return false;
    }
    LOG_DEBUG(std::format("Viewport {} left channel {}", viewportId, channelId));
    return true;
}

bool SynchronizationEngine::isProcessingSync() const noexcept
{
    return impl_->processingSync_;
}

void SynchronizationEngine::beginTopologyChange()
{
    impl_->topologyChanging_ = true;
}

size_t SynchronizationEngine::rebuildSubscriptions()
{
    impl_->topologyChanging_ = false;

    size_t resubscribed = 0;
    for (auto& group : impl_->groups_) {
        std::vector<std::string> missing;
        for (const auto& member : group.members) {
            if (!impl_->registry_.has(member)) {
                missing.push_back(member);
                continue;
            }
            impl_->registry_.detachListeners(member, listenerTag(group.id));
            impl_->attachListeners(group, member);
            ++resubscribed;
        }
        for (const auto& member : missing) {
            impl_->removeMember(group, member);
            LOG_DEBUG(std::format("Pruned {} from sync group {} after layout change",
                                  member, group.id));
        }
    }
    return resubscribed;
}

bool SynchronizationEngine::isTopologyChanging() const noexcept
{
    return impl_->topologyChanging_;
}

size_t SynchronizationEngine::pruneMissingViewports()
{
    size_t pruned = 0;
    for (auto& group : impl_->groups_) {
        std::vector<std::string> missing;
        std::copy_if(group.members.begin(), group.members.end(), std::back_inserter(missing),
            [this](const std::string& id) { return !impl_->registry_.has(id); });
        for (const auto& member : missing) {
            if (impl_->removeMember(group, member)) {
                ++pruned;
            }
        }
    }
    return pruned;
}

size_t SynchronizationEngine::removeEmptyGroups()
{
    std::vector<std::string> empty;
    for (const auto& group : impl_->groups_) {
        if (group.members.empty()) {
            empty.push_back(group.id);
        }
    }
    for (const auto& groupId : empty) {
        removeSyncGroup(groupId);
    }
    return empty.size();
}

size_t SynchronizationEngine::destroy()
{
    std::vector<std::string> ids;
    for (const auto& group : impl_->groups_) {
        ids.push_back(group.id);
    }
    for (const auto& groupId : ids) {
        removeSyncGroup(groupId);
    }
    impl_->channels_.clear();
    LOG_INFO(std::format("Synchronization engine destroyed ({} groups removed)", ids.size()));
    return ids.size();
}

} // namespace viewport_coordinator::services
