#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QStandardPaths>

#include <nlohmann/json.hpp>

#include "services/persistence/layout_state_persistence.hpp"
#include "services/persistence/persistence_service.hpp"
#include "test_utils/memory_persistence_service.hpp"

using namespace viewport_coordinator::services;
using viewport_coordinator::test_utils::MemoryPersistenceService;

namespace {

int argc = 0;
char* argv[] = {nullptr};
QCoreApplication app(argc, argv);

StoredLayoutState makeState(const std::string& layoutName, int rows, int cols) {
    StoredLayoutState state;
    state.layoutName = layoutName;
    state.rows = rows;
    state.cols = cols;
    state.activeIndex = 1;

    ViewportStateSnapshot snapshot;
    snapshot.index = 1;
    snapshot.viewportId = "viewport-1";
    snapshot.isActive = true;
    Camera camera;
    camera.position = {1.0, 2.0, 3.0};
    camera.parallelScale = 42.5;
    camera.flipVertical = true;
    snapshot.camera = camera;
    ViewportProperties properties;
    properties.voiRange = VoiRange{-160.0, 240.0};
    properties.interpolation = InterpolationType::Nearest;
    snapshot.properties = properties;
    snapshot.imageId = "wadouri:ct-12";
    state.viewports.push_back(snapshot);

    SyncGroup group;
    group.id = "g1";
    group.members = {"viewport-0", "viewport-1"};
    group.active = false;
    group.syncTypes = {SyncType::Pan, SyncType::WindowLevel};
    state.syncGroups.push_back(group);
    return state;
}

class LayoutStatePersistenceTest : public ::testing::Test {
protected:
    MemoryPersistenceService backing_;
    LayoutStatePersistence persistence_{backing_};
};

}  // anonymous namespace

// =============================================================================
// Layout states
// =============================================================================

TEST_F(LayoutStatePersistenceTest, SaveAndLoadPreservesState) {
    auto id = persistence_.saveLayoutState("Reading", makeState("2x2", 2, 2));
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(id->starts_with("layout-"));
    EXPECT_EQ(backing_.purposes[LayoutStatePersistence::kLayoutStateKey], "layout-state");

    auto loaded = persistence_.loadLayoutState(*id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, "Reading");
    EXPECT_EQ(loaded->layoutName, "2x2");
    EXPECT_EQ(loaded->activeIndex, 1);
    EXPECT_FALSE(loaded->createdAt.empty());

    ASSERT_EQ(loaded->viewports.size(), 1u);
    const auto& snapshot = loaded->viewports.front();
    EXPECT_EQ(snapshot.viewportId, "viewport-1");
    ASSERT_TRUE(snapshot.camera.has_value());
    EXPECT_DOUBLE_EQ(snapshot.camera->parallelScale, 42.5);
    EXPECT_TRUE(snapshot.camera->flipVertical);
    ASSERT_TRUE(snapshot.properties && snapshot.properties->voiRange);
    EXPECT_DOUBLE_EQ(snapshot.properties->voiRange->upper, 240.0);
    EXPECT_EQ(snapshot.properties->interpolation, InterpolationType::Nearest);
    EXPECT_EQ(snapshot.imageId, "wadouri:ct-12");

    ASSERT_EQ(loaded->syncGroups.size(), 1u);
    EXPECT_FALSE(loaded->syncGroups.front().active);
    EXPECT_TRUE(loaded->syncGroups.front().hasType(SyncType::WindowLevel));
}

TEST_F(LayoutStatePersistenceTest, NewestFirstAndCapped) {
    persistence_.setMaxStoredLayouts(3);
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = persistence_.saveLayoutState("state-" + std::to_string(i), makeState("1x1", 1, 1));
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }

    auto states = persistence_.getAllStoredStates();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0].name, "state-4");
    EXPECT_EQ(states[2].name, "state-2");
    EXPECT_FALSE(persistence_.loadLayoutState(ids[0]).has_value());
}

TEST_F(LayoutStatePersistenceTest, DefaultCapIsTen) {
    EXPECT_EQ(persistence_.maxStoredLayouts(), 10u);
    for (int i = 0; i < 12; ++i) {
        ASSERT_TRUE(persistence_.saveLayoutState("s", makeState("1x1", 1, 1)).has_value());
    }
    EXPECT_EQ(persistence_.getAllStoredStates().size(), 10u);
}

TEST_F(LayoutStatePersistenceTest, DeleteAndClear) {
    auto first = persistence_.saveLayoutState("a", makeState("1x1", 1, 1));
    auto second = persistence_.saveLayoutState("b", makeState("2x2", 2, 2));
    ASSERT_TRUE(first && second);

    EXPECT_TRUE(persistence_.deleteLayoutState(*first));
    EXPECT_FALSE(persistence_.deleteLayoutState(*first));
    EXPECT_EQ(persistence_.getAllStoredStates().size(), 1u);

    EXPECT_TRUE(persistence_.clearAllStates());
    EXPECT_TRUE(persistence_.getAllStoredStates().empty());
}

TEST_F(LayoutStatePersistenceTest, WriteFailureReported) {
    backing_.failWrites = true;
    auto id = persistence_.saveLayoutState("a", makeState("1x1", 1, 1));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ViewportError::Code::PersistenceFailure);
}

TEST_F(LayoutStatePersistenceTest, CorruptStorageYieldsEmptyList) {
    backing_.values[LayoutStatePersistence::kLayoutStateKey] = "{not json";
    EXPECT_TRUE(persistence_.getAllStoredStates().empty());

    backing_.values[LayoutStatePersistence::kLayoutStateKey] = R"({"id": "x"})";
    EXPECT_TRUE(persistence_.getAllStoredStates().empty());
}

// =============================================================================
// Export / import
// =============================================================================

TEST_F(LayoutStatePersistenceTest, ExportThenImportIntoFreshStore) {
    ASSERT_TRUE(persistence_.saveLayoutState("a", makeState("1x3", 1, 3)).has_value());
    ASSERT_TRUE(persistence_.saveLayoutState("b", makeState("3x1", 3, 1)).has_value());
    auto exported = persistence_.exportLayoutStates();

    MemoryPersistenceService otherBacking;
    LayoutStatePersistence other(otherBacking);
    ASSERT_TRUE(other.saveLayoutState("existing", makeState("1x1", 1, 1)).has_value());

    auto imported = other.importLayoutStates(exported);
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(*imported, 2u);

    auto states = other.getAllStoredStates();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0].name, "b");
    EXPECT_EQ(states[2].name, "existing");
}

TEST_F(LayoutStatePersistenceTest, ImportSkipsInvalidEntries) {
    nlohmann::json data = nlohmann::json::parse(
        [&] {
            MemoryPersistenceService scratch;
            LayoutStatePersistence source(scratch);
            (void)source.saveLayoutState("valid", makeState("2x2", 2, 2));
            return source.exportLayoutStates();
        }());
    data.push_back({{"id", 5}, {"name", "broken"}});

    auto imported = persistence_.importLayoutStates(data.dump());
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(*imported, 1u);
}

TEST_F(LayoutStatePersistenceTest, ImportRejectsGarbage) {
    auto notJson = persistence_.importLayoutStates("][");
    ASSERT_FALSE(notJson.has_value());
    EXPECT_EQ(notJson.error().code, ViewportError::Code::InvalidLayoutConfig);

    EXPECT_FALSE(persistence_.importLayoutStates(R"({"a": 1})").has_value());
    EXPECT_FALSE(persistence_.importLayoutStates("[]").has_value());
}

// =============================================================================
// Sync settings
// =============================================================================

TEST_F(LayoutStatePersistenceTest, SyncSettingsRoundTrip) {
    SyncGroup group;
    group.id = "default-sync-group";
    group.members = {"viewport-0", "viewport-1"};
    group.syncTypes = {SyncType::Zoom, SyncType::Camera};

    ASSERT_TRUE(persistence_.saveSyncSettings({group}));
    auto groups = persistence_.loadSyncSettings();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].members, group.members);
    EXPECT_EQ(groups[0].syncTypes, group.syncTypes);
    EXPECT_TRUE(groups[0].active);
}

TEST_F(LayoutStatePersistenceTest, UnknownSyncTypeNamesIgnored) {
    backing_.values[LayoutStatePersistence::kSyncSettingsKey] =
        R"([{"id": "g", "viewports": ["a"], "active": true, "syncTypes": ["pan", "spin"]}])";
    auto groups = persistence_.loadSyncSettings();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].syncTypes, (SyncTypeSet{SyncType::Pan}));
}

// =============================================================================
// SettingsPersistenceService
// =============================================================================

TEST(SettingsPersistenceServiceTest, StoreRetrieveRemove) {
    QStandardPaths::setTestModeEnabled(true);
    SettingsPersistenceService service("ViewportCoordinatorTest", "PersistenceTest");
    service.clear();

    EXPECT_TRUE(service.store("viewer-layout-state", "[1,2,3]", "layout-state"));
    EXPECT_EQ(service.retrieve("viewer-layout-state"), "[1,2,3]");
    EXPECT_EQ(service.purposeOf("viewer-layout-state"), "layout-state");

    EXPECT_TRUE(service.remove("viewer-layout-state"));
    EXPECT_FALSE(service.remove("viewer-layout-state"));
    EXPECT_FALSE(service.retrieve("viewer-layout-state").has_value());

    service.clear();
}
