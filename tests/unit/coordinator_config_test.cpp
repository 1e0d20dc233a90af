#include "core/coordinator_config.hpp"

#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>

using namespace viewport_coordinator;
using namespace viewport_coordinator::core;
using namespace std::chrono_literals;

namespace {

int argc = 0;
char* argv[] = {nullptr};
QCoreApplication app(argc, argv);

class CoordinatorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tempDir_.isValid());
        settings_ = std::make_unique<QSettings>(tempDir_.filePath("coordinator.ini"),
                                                QSettings::IniFormat);
    }

    QTemporaryDir tempDir_;
    std::unique_ptr<QSettings> settings_;
};

}  // anonymous namespace

TEST(CoordinatorConfigDefaults, MatchDocumentedValues) {
    CoordinatorConfig config;
    EXPECT_EQ(config.stateRestoreDelay, 50ms);
    EXPECT_EQ(config.annotationRestoreDelay, 200ms);
    EXPECT_EQ(config.restorePollInterval, 10ms);
    EXPECT_EQ(config.maxRestoreAttempts, 50);
    EXPECT_EQ(config.annotationGracePeriod, 500ms);
    EXPECT_EQ(config.autoCleanupInterval, 5min);
    EXPECT_EQ(config.minimumSurfaceExtent, 200);
    EXPECT_EQ(config.layoutHistoryLimit, 10u);
    EXPECT_EQ(config.maxStoredLayouts, 10u);
    EXPECT_EQ(config.defaultLayout, "1x1");
    EXPECT_EQ(config.remapPolicy, AnnotationRemapPolicy::FirstAvailable);
    EXPECT_TRUE(config.isValid());
}

TEST(CoordinatorConfigDefaults, InvalidValuesDetected) {
    CoordinatorConfig config;
    config.restorePollInterval = 0ms;
    EXPECT_FALSE(config.isValid());

    config = {};
    config.layoutHistoryLimit = 0;
    EXPECT_FALSE(config.isValid());

    config = {};
    config.defaultLayout.clear();
    EXPECT_FALSE(config.isValid());
}

TEST(CoordinatorConfigDefaults, RemapPolicyNames) {
    EXPECT_EQ(to_string(AnnotationRemapPolicy::DropUnmatched), "DropUnmatched");
    EXPECT_EQ(remap_policy_from_string("DropUnmatched"), AnnotationRemapPolicy::DropUnmatched);
    EXPECT_EQ(remap_policy_from_string("FirstAvailable"), AnnotationRemapPolicy::FirstAvailable);
    EXPECT_EQ(remap_policy_from_string("bogus"), AnnotationRemapPolicy::FirstAvailable);
}

TEST_F(CoordinatorConfigTest, EmptySettingsYieldDefaults) {
    auto config = loadCoordinatorConfig(*settings_);
    CoordinatorConfig defaults;
    EXPECT_EQ(config.stateRestoreDelay, defaults.stateRestoreDelay);
    EXPECT_EQ(config.maxStoredLayouts, defaults.maxStoredLayouts);
    EXPECT_EQ(config.defaultLayout, defaults.defaultLayout);
}

TEST_F(CoordinatorConfigTest, SaveAndLoad) {
    CoordinatorConfig config;
    config.stateRestoreDelay = 75ms;
    config.maxRestoreAttempts = 20;
    config.layoutHistoryLimit = 4;
    config.defaultLayout = "2x2";
    config.remapPolicy = AnnotationRemapPolicy::DropUnmatched;
    config.logLevel = AppLogLevel::Debug;

    saveCoordinatorConfig(*settings_, config);
    auto loaded = loadCoordinatorConfig(*settings_);

    EXPECT_EQ(loaded.stateRestoreDelay, 75ms);
    EXPECT_EQ(loaded.maxRestoreAttempts, 20);
    EXPECT_EQ(loaded.layoutHistoryLimit, 4u);
    EXPECT_EQ(loaded.defaultLayout, "2x2");
    EXPECT_EQ(loaded.remapPolicy, AnnotationRemapPolicy::DropUnmatched);
    EXPECT_EQ(loaded.logLevel, AppLogLevel::Debug);
}

TEST_F(CoordinatorConfigTest, InvalidEntriesFallBack) {
    settings_->beginGroup("ViewportCoordinator");
    settings_->setValue("restorePollIntervalMs", 0);
    settings_->setValue("maxRestoreAttempts", -3);
    settings_->setValue("minimumSurfaceExtent", "wide");
    settings_->setValue("logLevel", 42);
    settings_->endGroup();

    auto config = loadCoordinatorConfig(*settings_);
    EXPECT_EQ(config.restorePollInterval, 10ms);
    EXPECT_EQ(config.maxRestoreAttempts, 50);
    EXPECT_EQ(config.minimumSurfaceExtent, 200);
    EXPECT_EQ(config.logLevel, AppLogLevel::Information);
    EXPECT_TRUE(config.isValid());
}
