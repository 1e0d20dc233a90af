#include <gtest/gtest.h>

#include <QApplication>
#include <QSignalSpy>
#include <QTest>
#include <QWidget>

#include "core/coordinator_config.hpp"
#include "services/annotation/annotation_store.hpp"
#include "services/viewport/synchronization_engine.hpp"
#include "services/viewport/viewport_registry.hpp"
#include "test_utils/fake_rendering_engine.hpp"
#include "ui/layout_transition_controller.hpp"
#include "ui/viewport_cleanup_manager.hpp"

using namespace viewport_coordinator;
using namespace viewport_coordinator::services;
using viewport_coordinator::test_utils::FakeRenderingEngine;
using viewport_coordinator::ui::LayoutTransitionController;
using viewport_coordinator::ui::ViewportCleanupManager;

namespace {

int argc = 0;
char* argv[] = {nullptr};
QApplication app(argc, argv);

using namespace std::chrono_literals;

class ViewportCleanupManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 4; ++i) {
            surfaces_[i].resize(256, 256);
            ASSERT_TRUE(registry_.create("v" + std::to_string(i), &surfaces_[i]).has_value());
        }
        const SyncTypeSet types{SyncType::Pan, SyncType::WindowLevel};
        ASSERT_TRUE(engine_.createSyncGroup("g1", types).has_value());
        ASSERT_TRUE(engine_.createSyncGroup("g2", types).has_value());
        ASSERT_TRUE(engine_.addViewportToSyncGroup("g1", "v0").has_value());
        ASSERT_TRUE(engine_.addViewportToSyncGroup("g1", "v1").has_value());
        ASSERT_TRUE(engine_.addViewportToSyncGroup("g2", "v2").has_value());
        ASSERT_TRUE(engine_.addViewportToSyncGroup("g2", "v3").has_value());
    }

    FakeRenderingEngine renderer_;
    ViewportRegistry registry_{renderer_};
    SynchronizationEngine engine_{registry_};
    AnnotationStore store_;
    QWidget surfaces_[4];
    LayoutTransitionController controller_{registry_, store_, core::CoordinatorConfig{}};
    ViewportCleanupManager cleanup_{registry_, engine_, controller_};
};

}  // anonymous namespace

// =============================================================================
// Targeted cleanup
// =============================================================================

TEST_F(ViewportCleanupManagerTest, TargetedCleanupReleasesMembership) {
    auto stats = cleanup_.cleanupSpecificViewports({"v0", "v1"});

    EXPECT_EQ(stats.viewportsRemoved, 2u);
    EXPECT_GT(stats.listenersRemoved, 0u);
    EXPECT_EQ(stats.memoryFreedBytes, 2048u);
    EXPECT_TRUE(stats.errors.empty());

    EXPECT_FALSE(registry_.has("v0"));
    EXPECT_FALSE(registry_.has("v1"));
    EXPECT_TRUE(engine_.getViewportSyncGroups("v0").empty());
    EXPECT_TRUE(engine_.getViewportSyncGroups("v1").empty());
    EXPECT_TRUE(engine_.getSyncGroup("g1")->members.empty());
    EXPECT_EQ(engine_.getSyncGroup("g2")->members.size(), 2u);
    EXPECT_FALSE(renderer_.isBound("v0"));
    EXPECT_EQ(renderer_.observerCount("v0"), 0u);
}

TEST_F(ViewportCleanupManagerTest, TargetedCleanupReportsUnknownIds) {
    auto stats = cleanup_.cleanupSpecificViewports({"v2", "missing"});

    EXPECT_EQ(stats.viewportsRemoved, 1u);
    ASSERT_EQ(stats.errors.size(), 1u);
    EXPECT_NE(stats.errors.front().find("missing"), std::string::npos);
    EXPECT_EQ(registry_.count(), 3u);
}

TEST_F(ViewportCleanupManagerTest, TargetedCleanupRemovesDisplayRegion) {
    controller_.setLayout("2x2");
    ASSERT_EQ(controller_.viewportCount(), 4);

    auto stats = cleanup_.cleanupSpecificViewports({"viewport-1"});

    EXPECT_EQ(stats.viewportsRemoved, 1u);
    EXPECT_EQ(controller_.viewportCount(), 3);
    EXPECT_EQ(controller_.indexOfViewport("viewport-1"), -1);
}

TEST_F(ViewportCleanupManagerTest, TargetedCleanupKeepsLastDisplayRegion) {
    controller_.setLayout("1x1");
    ASSERT_TRUE(engine_.createSyncGroup("solo", {SyncType::Pan}).has_value());
    ASSERT_TRUE(engine_.addViewportToSyncGroup("solo", "viewport-0").has_value());

    auto stats = cleanup_.cleanupSpecificViewports({"viewport-0", "v3"});

    EXPECT_EQ(stats.viewportsRemoved, 1u);
    ASSERT_EQ(stats.errors.size(), 1u);
    EXPECT_NE(stats.errors.front().find("viewport-0"), std::string::npos);
    EXPECT_TRUE(registry_.has("viewport-0"));
    EXPECT_FALSE(registry_.has("v3"));
    EXPECT_EQ(engine_.getSyncGroup("solo")->members, std::vector<std::string>{"viewport-0"});
    EXPECT_EQ(controller_.viewportCount(), 1);
    EXPECT_EQ(controller_.viewports().size(), 1u);
    EXPECT_EQ(controller_.setLayout("1x1").size(), 1u);
}

// =============================================================================
// Full cleanup
// =============================================================================

TEST_F(ViewportCleanupManagerTest, FullCleanupReleasesEverything) {
    renderer_.purgeResult = 5000;

    auto stats = cleanup_.performFullCleanup();

    EXPECT_EQ(stats.viewportsRemoved, 4u);
    EXPECT_EQ(stats.syncGroupsRemoved, 2u);
    EXPECT_GT(stats.listenersRemoved, 0u);
    EXPECT_EQ(stats.memoryFreedBytes, 4u * 1024u + 5000u);
    EXPECT_TRUE(stats.errors.empty());

    EXPECT_EQ(engine_.syncGroupCount(), 0u);
    EXPECT_EQ(renderer_.purgeCalls, 1);
    EXPECT_EQ(controller_.currentLayout(), "1x1");
    EXPECT_EQ(registry_.allIds(), std::vector<std::string>{"viewport-0"});
}

TEST_F(ViewportCleanupManagerTest, FullCleanupContinuesPastFailingStep) {
    renderer_.failPurge = true;
    renderer_.failUnbind = true;

    auto stats = cleanup_.performFullCleanup();

    EXPECT_EQ(stats.viewportsRemoved, 4u);
    EXPECT_EQ(stats.syncGroupsRemoved, 2u);
    EXPECT_EQ(stats.memoryFreedBytes, 4u * 1024u);
    ASSERT_EQ(stats.errors.size(), 1u);
    EXPECT_EQ(stats.errors.front().rfind("render cache", 0), 0u);
    EXPECT_EQ(controller_.currentLayout(), "1x1");
}

TEST_F(ViewportCleanupManagerTest, FullCleanupWithoutCacheReportOnlyCountsViewports) {
    auto stats = cleanup_.performFullCleanup();

    EXPECT_EQ(stats.memoryFreedBytes, 4u * 1024u);
}

// =============================================================================
// Light cleanup
// =============================================================================

TEST_F(ViewportCleanupManagerTest, LightCleanupRemovesOnlyEmptyGroups) {
    ASSERT_TRUE(engine_.createSyncGroup("empty").has_value());

    auto stats = cleanup_.performLightCleanup();

    EXPECT_EQ(stats.syncGroupsRemoved, 1u);
    EXPECT_EQ(stats.viewportsRemoved, 0u);
    EXPECT_EQ(engine_.syncGroupCount(), 2u);
    EXPECT_EQ(registry_.count(), 4u);
}

TEST_F(ViewportCleanupManagerTest, LightCleanupAfterTargetedCleanupDropsDrainedGroup) {
    cleanup_.cleanupSpecificViewports({"v0", "v1"});

    auto stats = cleanup_.performLightCleanup();

    EXPECT_EQ(stats.syncGroupsRemoved, 1u);
    EXPECT_FALSE(engine_.getSyncGroup("g1").has_value());
    EXPECT_TRUE(engine_.getSyncGroup("g2").has_value());
}

// =============================================================================
// Scheduling, history and estimates
// =============================================================================

TEST_F(ViewportCleanupManagerTest, AutoCleanupRunsLightCleanup) {
    ASSERT_TRUE(engine_.createSyncGroup("empty").has_value());
    QSignalSpy spy(&cleanup_, &ViewportCleanupManager::cleanupCompleted);

    cleanup_.scheduleAutoCleanup(10ms);
    EXPECT_TRUE(cleanup_.isAutoCleanupScheduled());

    ASSERT_TRUE(QTest::qWaitFor([&spy]() { return spy.count() > 0; }, 2000));
    EXPECT_FALSE(engine_.getSyncGroup("empty").has_value());
    EXPECT_EQ(registry_.count(), 4u);

    cleanup_.stopAutoCleanup();
    EXPECT_FALSE(cleanup_.isAutoCleanupScheduled());
}

TEST_F(ViewportCleanupManagerTest, NonPositiveIntervalIgnored) {
    cleanup_.scheduleAutoCleanup(0ms);
    EXPECT_FALSE(cleanup_.isAutoCleanupScheduled());
}

TEST_F(ViewportCleanupManagerTest, CompletionSignalCarriesStats) {
    QSignalSpy spy(&cleanup_, &ViewportCleanupManager::cleanupCompleted);

    cleanup_.cleanupSpecificViewports({"v3"});

    ASSERT_EQ(spy.count(), 1);
    auto stats = spy.first().at(0).value<CleanupStats>();
    EXPECT_EQ(stats.viewportsRemoved, 1u);
}

TEST_F(ViewportCleanupManagerTest, HistoryIsBounded) {
    for (size_t i = 0; i < ViewportCleanupManager::kMaxHistoryEntries + 5; ++i) {
        cleanup_.performLightCleanup();
    }
    cleanup_.cleanupSpecificViewports({"v0"});

    auto history = cleanup_.cleanupHistory();
    ASSERT_EQ(history.size(), ViewportCleanupManager::kMaxHistoryEntries);
    EXPECT_EQ(history.back().viewportsRemoved, 1u);

    cleanup_.clearCleanupHistory();
    EXPECT_TRUE(cleanup_.cleanupHistory().empty());
}

TEST_F(ViewportCleanupManagerTest, MemoryEstimateCountsViewportsAndGroups) {
    auto estimate = cleanup_.getMemoryUsageEstimate();

    EXPECT_EQ(estimate.viewportCount, 4u);
    EXPECT_EQ(estimate.syncGroupCount, 2u);
    EXPECT_DOUBLE_EQ(estimate.estimatedMemoryMB, 4.2);

    cleanup_.performFullCleanup();
    estimate = cleanup_.getMemoryUsageEstimate();
    EXPECT_EQ(estimate.viewportCount, 1u);
    EXPECT_EQ(estimate.syncGroupCount, 0u);
}
