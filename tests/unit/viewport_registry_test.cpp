#include <gtest/gtest.h>

#include <QApplication>
#include <QWidget>

#include "services/viewport/viewport_registry.hpp"
#include "test_utils/fake_rendering_engine.hpp"

using namespace viewport_coordinator::services;
using viewport_coordinator::test_utils::FakeRenderingEngine;

namespace {

// QApplication must exist for QWidget instantiation
int argc = 0;
char* argv[] = {nullptr};
QApplication app(argc, argv);

class ViewportRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (auto& surface : surfaces_) {
            surface.resize(320, 240);
        }
    }

    Viewport createOrFail(const std::string& id, int surfaceIndex = 0) {
        auto result = registry_.create(id, &surfaces_[surfaceIndex]);
        EXPECT_TRUE(result.has_value());
        return result.value_or(Viewport{});
    }

    FakeRenderingEngine renderer_;
    ViewportRegistry registry_{renderer_};
    QWidget surfaces_[4];
};

}  // anonymous namespace

// =============================================================================
// Creation
// =============================================================================

TEST_F(ViewportRegistryTest, FirstViewportBecomesActive) {
    auto first = createOrFail("v0", 0);
    auto second = createOrFail("v1", 1);

    EXPECT_TRUE(first.isActive);
    EXPECT_FALSE(second.isActive);
    EXPECT_EQ(registry_.activeId(), "v0");
    EXPECT_EQ(registry_.count(), 2u);
    EXPECT_TRUE(renderer_.isBound("v0"));
    EXPECT_TRUE(renderer_.isBound("v1"));
}

TEST_F(ViewportRegistryTest, DuplicateCreateReturnsExisting) {
    auto first = createOrFail("v0", 0);
    auto again = registry_.create("v0", &surfaces_[1]);

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->binding, first.binding);
    EXPECT_EQ(again->surface, &surfaces_[0]);
    EXPECT_EQ(registry_.count(), 1u);
}

TEST_F(ViewportRegistryTest, NullSurfaceRejected) {
    auto result = registry_.create("v0", nullptr);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ViewportError::Code::InvalidSurface);
    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_FALSE(registry_.activeId().has_value());
}

TEST_F(ViewportRegistryTest, EmptyIdRejected) {
    auto result = registry_.create("", &surfaces_[0]);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(ViewportRegistryTest, ZeroExtentSurfaceGetsMinimumSize) {
    QWidget collapsed;
    collapsed.resize(0, 0);

    auto result = registry_.create("v0", &collapsed);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(collapsed.width(), 200);
    EXPECT_GE(collapsed.height(), 200);
    EXPECT_EQ(collapsed.minimumWidth(), 200);
}

TEST_F(ViewportRegistryTest, ConfiguredMinimumExtent) {
    registry_.setMinimumSurfaceExtent(64);
    QWidget collapsed;
    collapsed.resize(0, 0);

    ASSERT_TRUE(registry_.create("v0", &collapsed).has_value());
    EXPECT_EQ(collapsed.minimumHeight(), 64);
}

TEST_F(ViewportRegistryTest, BindFailureRecordsNothing) {
    renderer_.failBindFor.insert("v0");

    auto result = registry_.create("v0", &surfaces_[0]);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ViewportError::Code::RendererFailure);
    EXPECT_FALSE(registry_.has("v0"));
    EXPECT_FALSE(registry_.activeId().has_value());
}

// =============================================================================
// Removal and activation
// =============================================================================

TEST_F(ViewportRegistryTest, RemovingActivePromotesFirstRemaining) {
    createOrFail("v0", 0);
    createOrFail("v1", 1);
    createOrFail("v2", 2);
    ASSERT_TRUE(registry_.setActive("v2"));

    EXPECT_TRUE(registry_.remove("v2"));
    EXPECT_EQ(registry_.activeId(), "v0");
    EXPECT_TRUE(registry_.get("v0")->isActive);
    EXPECT_FALSE(renderer_.isBound("v2"));
}

TEST_F(ViewportRegistryTest, RemovingLastClearsActive) {
    createOrFail("v0");
    EXPECT_TRUE(registry_.remove("v0"));
    EXPECT_FALSE(registry_.activeId().has_value());
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(ViewportRegistryTest, RemoveUnknownReturnsFalse) {
    EXPECT_FALSE(registry_.remove("missing"));
}

TEST_F(ViewportRegistryTest, RemoveSurvivesUnbindFailure) {
    createOrFail("v0");
    renderer_.failUnbind = true;

    EXPECT_TRUE(registry_.remove("v0"));
    EXPECT_FALSE(registry_.has("v0"));
}

TEST_F(ViewportRegistryTest, RemovalCallbackNotified) {
    createOrFail("v0", 0);
    createOrFail("v1", 1);

    std::vector<std::string> removed;
    registry_.setRemovalCallback([&removed](const std::string& id) { removed.push_back(id); });

    EXPECT_EQ(registry_.removeAll(), 2u);
    EXPECT_EQ(removed, (std::vector<std::string>{"v0", "v1"}));
}

TEST_F(ViewportRegistryTest, SetActiveUnknownFails) {
    createOrFail("v0");
    EXPECT_FALSE(registry_.setActive("missing"));
    EXPECT_EQ(registry_.activeId(), "v0");
}

TEST_F(ViewportRegistryTest, ExactlyOneActive) {
    createOrFail("v0", 0);
    createOrFail("v1", 1);
    createOrFail("v2", 2);
    registry_.setActive("v1");

    int active = 0;
    for (const auto& id : registry_.allIds()) {
        if (registry_.get(id)->isActive) ++active;
    }
    EXPECT_EQ(active, 1);
}

// =============================================================================
// Rendering
// =============================================================================

TEST_F(ViewportRegistryTest, RenderFailuresAreSwallowed) {
    createOrFail("v0");
    renderer_.failRenderAll = true;

    EXPECT_NO_THROW(registry_.renderAll());
    EXPECT_EQ(renderer_.renderAllCalls, 1);
    EXPECT_TRUE(registry_.render("v0"));
    EXPECT_FALSE(registry_.render("missing"));
}

// =============================================================================
// Listener subscriptions
// =============================================================================

TEST_F(ViewportRegistryTest, ListenersAttachedAndDetached) {
    createOrFail("v0");

    int notified = 0;
    auto handle = registry_.attachListener("v0", RenderEvent::CameraModified,
        [&notified](const std::string&, RenderEvent) { ++notified; }, "sync:g1");
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(registry_.listenerCount("v0"), 1u);
    EXPECT_EQ(renderer_.observerCount("v0"), 1u);

    renderer_.interact("v0", Camera{});
    EXPECT_EQ(notified, 1);

    EXPECT_TRUE(registry_.detachListener(*handle));
    EXPECT_FALSE(registry_.detachListener(*handle));
    EXPECT_EQ(renderer_.observerCount("v0"), 0u);

    renderer_.interact("v0", Camera{});
    EXPECT_EQ(notified, 1);
}

TEST_F(ViewportRegistryTest, DetachListenersByTag) {
    createOrFail("v0");
    auto noop = [](const std::string&, RenderEvent) {};
    registry_.attachListener("v0", RenderEvent::CameraModified, noop, "sync:g1");
    registry_.attachListener("v0", RenderEvent::VoiModified, noop, "sync:g1");
    registry_.attachListener("v0", RenderEvent::CameraModified, noop, "sync:g2");

    EXPECT_EQ(registry_.listenerCount("v0", "sync:g1"), 2u);
    EXPECT_EQ(registry_.detachListeners("v0", "sync:g1"), 2u);
    EXPECT_EQ(registry_.listenerCount("v0"), 1u);
    EXPECT_EQ(registry_.totalListenerCount(), 1u);
}

TEST_F(ViewportRegistryTest, DetachAllListenersKeepsViewport) {
    createOrFail("v0");
    createOrFail("v1", 1);
    auto noop = [](const std::string&, RenderEvent) {};
    registry_.attachListener("v0", RenderEvent::CameraModified, noop, "a");
    registry_.attachListener("v0", RenderEvent::VoiModified, noop, "b");
    registry_.attachListener("v1", RenderEvent::CameraModified, noop, "a");

    EXPECT_EQ(registry_.detachAllListeners("v0"), 2u);
    EXPECT_EQ(registry_.detachAllListeners("v0"), 0u);
    EXPECT_EQ(renderer_.observerCount("v0"), 0u);
    EXPECT_TRUE(registry_.has("v0"));
    EXPECT_EQ(registry_.listenerCount("v1"), 1u);
}

TEST_F(ViewportRegistryTest, RemoveReleasesListeners) {
    createOrFail("v0");
    auto noop = [](const std::string&, RenderEvent) {};
    registry_.attachListener("v0", RenderEvent::CameraModified, noop, "a");
    registry_.attachListener("v0", RenderEvent::VoiModified, noop, "b");
    ASSERT_EQ(renderer_.observerCount("v0"), 2u);

    registry_.remove("v0");
    EXPECT_EQ(registry_.totalListenerCount(), 0u);
}

TEST_F(ViewportRegistryTest, AttachToUnknownViewportFails) {
    auto handle = registry_.attachListener("missing", RenderEvent::CameraModified,
        [](const std::string&, RenderEvent) {}, "tag");
    EXPECT_FALSE(handle.has_value());
}
