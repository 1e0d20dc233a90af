#pragma once

#include "services/render/i_rendering_engine.hpp"

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace viewport_coordinator::test_utils {

/**
 * @brief In-memory rendering engine for coordinator tests
 *
 * Observers fire synchronously from setCamera()/setProperties() like the VTK
 * engine does. Failures can be injected per call type.
 */
class FakeRenderingEngine : public services::IRenderingEngine {
public:
    struct Binding {
        services::RenderHandle handle;
        services::ViewportKind kind = services::ViewportKind::Stack;
        services::Camera camera;
        services::ViewportProperties properties;
        std::optional<std::string> imageId;
        std::map<services::ObserverId, std::pair<services::RenderEvent, EventCallback>> observers;
    };

    // Failure injection
    std::set<std::string> failBindFor;
    std::set<std::string> failSetCameraFor;
    bool failBind = false;
    bool failUnbind = false;
    bool failGetCamera = false;
    bool failRenderAll = false;
    bool failPurge = false;
    std::optional<std::size_t> purgeResult;

    // Call records
    std::map<std::string, int> setCameraCalls;
    std::map<std::string, int> setPropertiesCalls;
    std::map<std::string, int> renderCalls;
    std::vector<std::string> unbindCalls;
    int renderAllCalls = 0;
    int purgeCalls = 0;

    services::RenderHandle bind(const std::string& viewportId, QWidget*,
                                services::ViewportKind kind,
                                const services::ViewportOptions&) override {
        if (failBind || failBindFor.contains(viewportId)) {
            throw std::runtime_error("bind failed for " + viewportId);
        }
        auto& binding = bindings_[viewportId];
        if (!binding.handle.isValid()) {
            binding.handle = services::RenderHandle{nextHandle_++};
        }
        binding.kind = kind;
        return binding.handle;
    }

    void unbind(const std::string& viewportId) override {
        unbindCalls.push_back(viewportId);
        if (failUnbind) {
            throw std::runtime_error("unbind failed for " + viewportId);
        }
        bindings_.erase(viewportId);
    }

    std::optional<services::RenderHandle> getHandle(const std::string& viewportId) const override {
        auto it = bindings_.find(viewportId);
        if (it == bindings_.end()) return std::nullopt;
        return it->second.handle;
    }

    services::Camera getCamera(services::RenderHandle handle) const override {
        if (failGetCamera) {
            throw std::runtime_error("getCamera failed");
        }
        return find(handle).camera;
    }

    void setCamera(services::RenderHandle handle, const services::Camera& camera) override {
        const auto id = idOf(handle);
        if (failSetCameraFor.contains(id)) {
            throw std::runtime_error("setCamera failed for " + id);
        }
        ++setCameraCalls[id];
        bindings_.at(id).camera = camera;
        fire(id, services::RenderEvent::CameraModified);
    }

    services::ViewportProperties getProperties(services::RenderHandle handle) const override {
        return find(handle).properties;
    }

    void setProperties(services::RenderHandle handle,
                       const services::ViewportProperties& properties) override {
        const auto id = idOf(handle);
        ++setPropertiesCalls[id];
        bindings_.at(id).properties = properties;
        fire(id, services::RenderEvent::VoiModified);
    }

    std::optional<std::string> currentImageId(services::RenderHandle handle) const override {
        return find(handle).imageId;
    }

    void render(services::RenderHandle handle) override {
        ++renderCalls[idOf(handle)];
    }

    void renderAll() override {
        ++renderAllCalls;
        if (failRenderAll) {
            throw std::runtime_error("renderAll failed");
        }
    }

    services::ObserverId addObserver(services::RenderHandle handle, services::RenderEvent event,
                                     EventCallback callback) override {
        auto& binding = bindings_.at(idOf(handle));
        const auto id = nextObserver_++;
        binding.observers[id] = {event, std::move(callback)};
        return id;
    }

    bool removeObserver(services::RenderHandle handle, services::ObserverId observer) override {
        for (auto& [id, binding] : bindings_) {
            if (binding.handle == handle) {
                return binding.observers.erase(observer) > 0;
            }
        }
        return false;
    }

    std::optional<std::size_t> purgeCache() override {
        ++purgeCalls;
        if (failPurge) {
            throw std::runtime_error("purge failed");
        }
        return purgeResult;
    }

    // ==================== Test helpers ====================

    /// Simulate user interaction: change the camera without counting a setCamera call
    void interact(const std::string& viewportId, const services::Camera& camera) {
        bindings_.at(viewportId).camera = camera;
        fire(viewportId, services::RenderEvent::CameraModified);
    }

    void setImageId(const std::string& viewportId, const std::string& imageId) {
        bindings_.at(viewportId).imageId = imageId;
    }

    [[nodiscard]] bool isBound(const std::string& viewportId) const {
        return bindings_.contains(viewportId);
    }

    [[nodiscard]] const Binding& binding(const std::string& viewportId) const {
        return bindings_.at(viewportId);
    }

    [[nodiscard]] size_t observerCount(const std::string& viewportId) const {
        auto it = bindings_.find(viewportId);
        return it == bindings_.end() ? 0 : it->second.observers.size();
    }

    [[nodiscard]] size_t bindingCount() const { return bindings_.size(); }

private:
    const Binding& find(services::RenderHandle handle) const {
        return bindings_.at(idOf(handle));
    }

    std::string idOf(services::RenderHandle handle) const {
        for (const auto& [id, binding] : bindings_) {
            if (binding.handle == handle) return id;
        }
        throw std::out_of_range("unknown handle " + std::to_string(handle.value));
    }

    void fire(const std::string& viewportId, services::RenderEvent event) {
        std::vector<EventCallback> callbacks;
        for (const auto& [id, observer] : bindings_.at(viewportId).observers) {
            if (observer.first == event) callbacks.push_back(observer.second);
        }
        for (const auto& callback : callbacks) {
            callback(viewportId, event);
        }
    }

    std::map<std::string, Binding> bindings_;
    std::uint64_t nextHandle_ = 1;
    services::ObserverId nextObserver_ = 1;
};

}  // namespace viewport_coordinator::test_utils
