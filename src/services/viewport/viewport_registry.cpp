#include "services/viewport/viewport_registry.hpp"
#include <kcenon/common/logging/log_macros.h>

#include <algorithm>
#include <exception>
#include <format>

#include <QWidget>

namespace viewport_coordinator::services {

// ============================================================================
// Implementation Class
// ============================================================================

class ViewportRegistry::Impl {
public:
    struct Listener {
        std::uint64_t id = 0;
        ObserverId observer = 0;
        RenderEvent event = RenderEvent::CameraModified;
        std::string tag;
    };

    struct Entry {
        Viewport viewport;
        std::vector<Listener> listeners;
    };

    IRenderingEngine& renderer_;
    int minimumExtent_;

    // Insertion order is significant for active promotion
    std::vector<Entry> entries_;
    std::optional<std::string> activeId_;
    std::uint64_t nextListenerId_ = 1;
    RemovalCallback removalCallback_;

    Impl(IRenderingEngine& renderer, int minimumExtent)
        : renderer_(renderer), minimumExtent_(minimumExtent) {}

    Entry* find(const std::string& id) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&id](const Entry& e) { return e.viewport.id == id; });
        return it != entries_.end() ? &*it : nullptr;
    }

    const Entry* find(const std::string& id) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&id](const Entry& e) { return e.viewport.id == id; });
        return it != entries_.end() ? &*it : nullptr;
    }

    void markActive(const std::string& id) {
        for (auto& entry : entries_) {
            entry.viewport.isActive = (entry.viewport.id == id);
        }
        activeId_ = id;
    }

    void ensureMinimumExtent(QWidget* surface) const {
        if (surface->width() > 0 && surface->height() > 0) {
            return;
        }
        LOG_WARNING(std::format(
            "Display surface has zero extent ({}x{}), applying {}px fallback",
            surface->width(), surface->height(), minimumExtent_));
        surface->setMinimumSize(minimumExtent_, minimumExtent_);
        surface->resize(std::max(surface->width(), minimumExtent_),
                        std::max(surface->height(), minimumExtent_));
    }

    bool releaseListener(const Viewport& viewport, const Listener& listener) {
        try {
            renderer_.removeObserver(viewport.binding, listener.observer);
            return true;
        } catch (const std::exception& e) {
            LOG_WARNING(std::format("Failed to remove observer {} from {}: {}",
                                    listener.observer, viewport.id, e.what()));
            return false;
        }
    }

    // Detach listeners matching predicate; returns number detached
    template <typename Pred>
    size_t detachWhere(Entry& entry, Pred pred) {
        size_t detached = 0;
        auto it = entry.listeners.begin();
        while (it != entry.listeners.end()) {
            if (pred(*it)) {
                releaseListener(entry.viewport, *it);
                it = entry.listeners.erase(it);
                ++detached;
            } else {
                ++it;
            }
        }
        return detached;
    }
};

// ============================================================================
// ViewportRegistry
// ============================================================================

ViewportRegistry::ViewportRegistry(IRenderingEngine& renderer, int minimumSurfaceExtent)
    : impl_(std::make_unique<Impl>(renderer, minimumSurfaceExtent))
{
}

ViewportRegistry::~ViewportRegistry() = default;

std::expected<Viewport, ViewportError> ViewportRegistry::create(
    const std::string& id, QWidget* surface, ViewportKind kind,
    const ViewportOptions& options)
{
    if (id.empty()) {
        LOG_ERROR("Cannot create viewport with empty id");
        return std::unexpected(ViewportError{
            ViewportError::Code::UnknownViewport, "empty viewport id"});
    }

    if (auto* existing = impl_->find(id)) {
        LOG_WARNING(std::format("Viewport {} already exists, returning existing binding", id));
        return existing->viewport;
    }

    if (!surface) {
        LOG_ERROR(std::format("Cannot create viewport {}: no display surface", id));
        return std::unexpected(ViewportError{
            ViewportError::Code::InvalidSurface, id});
    }

    impl_->ensureMinimumExtent(surface);

    RenderHandle handle;
    try {
        handle = impl_->renderer_.bind(id, surface, kind, options);
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Renderer failed to bind viewport {}: {}", id, e.what()));
        return std::unexpected(ViewportError{
            ViewportError::Code::RendererFailure, std::format("{}: {}", id, e.what())});
    }

    if (!handle.isValid()) {
        LOG_ERROR(std::format("Renderer returned an invalid handle for viewport {}", id));
        return std::unexpected(ViewportError{
            ViewportError::Code::RendererFailure, std::format("{}: invalid handle", id)});
    }

    Impl::Entry entry;
    entry.viewport.id = id;
    entry.viewport.binding = handle;
    entry.viewport.surface = surface;
    entry.viewport.kind = kind;
    impl_->entries_.push_back(std::move(entry));

    if (!impl_->activeId_) {
        impl_->markActive(id);
    }

    LOG_DEBUG(std::format("Created viewport {} (handle={})", id, handle.value));
    return impl_->find(id)->viewport;
}

bool ViewportRegistry::remove(const std::string& id)
{
    auto it = std::find_if(impl_->entries_.begin(), impl_->entries_.end(),
        [&id](const Impl::Entry& e) { return e.viewport.id == id; });
    if (it == impl_->entries_.end()) {
        return false;
    }

    for (const auto& listener : it->listeners) {
        impl_->releaseListener(it->viewport, listener);
    }
    it->listeners.clear();

    try {
        impl_->renderer_.unbind(id);
    } catch (const std::exception& e) {
        LOG_WARNING(std::format("Renderer failed to unbind viewport {}: {}", id, e.what()));
    }

    bool wasActive = it->viewport.isActive;
    impl_->entries_.erase(it);

    if (wasActive) {
        if (impl_->entries_.empty()) {
            impl_->activeId_.reset();
        } else {
            impl_->markActive(impl_->entries_.front().viewport.id);
        }
    }

    LOG_DEBUG(std::format("Removed viewport {}", id));

    if (impl_->removalCallback_) {
        impl_->removalCallback_(id);
    }
    return true;
}

size_t ViewportRegistry::removeAll()
{
    size_t removed = 0;
    for (const auto& id : allIds()) {
        if (remove(id)) {
            ++removed;
        }
    }
    return removed;
}

bool ViewportRegistry::setActive(const std::string& id)
{
    if (!impl_->find(id)) {
        LOG_WARNING(std::format("Cannot activate unknown viewport {}", id));
        return false;
    }
    impl_->markActive(id);
    return true;
}

std::optional<Viewport> ViewportRegistry::get(const std::string& id) const
{
    if (const auto* entry = impl_->find(id)) {
        return entry->viewport;
    }
    return std::nullopt;
}

bool ViewportRegistry::has(const std::string& id) const
{
    return impl_->find(id) != nullptr;
}

std::vector<std::string> ViewportRegistry::allIds() const
{
    std::vector<std::string> ids;
    ids.reserve(impl_->entries_.size());
    for (const auto& entry : impl_->entries_) {
        ids.push_back(entry.viewport.id);
    }
    return ids;
}

size_t ViewportRegistry::count() const noexcept
{
    return impl_->entries_.size();
}

std::optional<std::string> ViewportRegistry::activeId() const
{
    return impl_->activeId_;
}

void ViewportRegistry::renderAll()
{
    try {
        impl_->renderer_.renderAll();
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Renderer failed to render all viewports: {}", e.what()));
    }
}

bool ViewportRegistry::render(const std::string& id)
{
    const auto* entry = impl_->find(id);
    if (!entry) {
        return false;
    }
    try {
        impl_->renderer_.render(entry->viewport.binding);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Renderer failed to render viewport {}: {}", id, e.what()));
        return false;
    }
}

std::optional<ListenerHandle> ViewportRegistry::attachListener(
    const std::string& id, RenderEvent event,
    IRenderingEngine::EventCallback callback, const std::string& tag)
{
    auto* entry = impl_->find(id);
    if (!entry) {
        LOG_WARNING(std::format("Cannot attach listener to unknown viewport {}", id));
        return std::nullopt;
    }

    ObserverId observer = 0;
    try {
        observer = impl_->renderer_.addObserver(entry->viewport.binding, event, std::move(callback));
    } catch (const std::exception& e) {
        LOG_ERROR(std::format("Renderer failed to add observer to {}: {}", id, e.what()));
        return std::nullopt;
    }

    Impl::Listener listener;
    listener.id = impl_->nextListenerId_++;
    listener.observer = observer;
    listener.event = event;
    listener.tag = tag;
    entry->listeners.push_back(listener);

    return ListenerHandle{id, listener.id};
}

bool ViewportRegistry::detachListener(const ListenerHandle& handle)
{
    auto* entry = impl_->find(handle.viewportId);
    if (!entry) {
        return false;
    }
    return impl_->detachWhere(*entry,
        [&handle](const Impl::Listener& l) { return l.id == handle.id; }) > 0;
}

size_t ViewportRegistry::detachListeners(const std::string& id, const std::string& tag)
{
    auto* entry = impl_->find(id);
    if (!entry) {
        return 0;
    }
    return impl_->detachWhere(*entry,
        [&tag](const Impl::Listener& l) { return l.tag == tag; });
}

size_t ViewportRegistry::detachAllListeners(const std::string& id)
{
    auto* entry = impl_->find(id);
    if (!entry) {
        return 0;
    }
    return impl_->detachWhere(*entry, [](const Impl::Listener&) { return true; });
}

size_t ViewportRegistry::listenerCount(const std::string& id) const
{
    const auto* entry = impl_->find(id);
    return entry ? entry->listeners.size() : 0;
}

size_t ViewportRegistry::listenerCount(const std::string& id, const std::string& tag) const
{
    const auto* entry = impl_->find(id);
    if (!entry) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(entry->listeners.begin(), entry->listeners.end(),
        [&tag](const Impl::Listener& l) { return l.tag == tag; }));
}

size_t ViewportRegistry::totalListenerCount() const
{
    size_t total = 0;
    for (const auto& entry : impl_->entries_) {
        total += entry.listeners.size();
    }
    return total;
}

IRenderingEngine& ViewportRegistry::renderer() noexcept
{
    return impl_->renderer_;
}

const IRenderingEngine& ViewportRegistry::renderer() const noexcept
{
    return impl_->renderer_;
}

void ViewportRegistry::setMinimumSurfaceExtent(int extent)
{
    impl_->minimumExtent_ = std::max(1, extent);
}

int ViewportRegistry::minimumSurfaceExtent() const noexcept
{
    return impl_->minimumExtent_;
}

void ViewportRegistry::setRemovalCallback(RemovalCallback callback)
{
    impl_->removalCallback_ = std::move(callback);
}

} // namespace viewport_coordinator::services
