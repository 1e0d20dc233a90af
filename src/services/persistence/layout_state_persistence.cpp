#include "services/persistence/layout_state_persistence.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <format>

#include <nlohmann/json.hpp>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        viewport_coordinator::logging::LoggerFactory::create("LayoutStatePersistence");
    return logger;
}

}  // anonymous namespace

namespace viewport_coordinator::services {

namespace {

using json = nlohmann::json;

std::string currentTimestamp()
{
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

json vec3ToJson(const std::array<double, 3>& v)
{
    return json::array({v[0], v[1], v[2]});
}

std::array<double, 3> vec3FromJson(const json& j)
{
    return {j.at(0).get<double>(), j.at(1).get<double>(), j.at(2).get<double>()};
}

json cameraToJson(const Camera& camera)
{
    return {
        {"position", vec3ToJson(camera.position)},
        {"focalPoint", vec3ToJson(camera.focalPoint)},
        {"viewUp", vec3ToJson(camera.viewUp)},
        {"parallelScale", camera.parallelScale},
        {"viewAngle", camera.viewAngle},
        {"parallelProjection", camera.parallelProjection},
        {"flipHorizontal", camera.flipHorizontal},
        {"flipVertical", camera.flipVertical},
    };
}

Camera cameraFromJson(const json& j)
{
    Camera camera;
    camera.position = vec3FromJson(j.at("position"));
    camera.focalPoint = vec3FromJson(j.at("focalPoint"));
    camera.viewUp = vec3FromJson(j.at("viewUp"));
    camera.parallelScale = j.value("parallelScale", 1.0);
    camera.viewAngle = j.value("viewAngle", 30.0);
    camera.parallelProjection = j.value("parallelProjection", true);
    camera.flipHorizontal = j.value("flipHorizontal", false);
    camera.flipVertical = j.value("flipVertical", false);
    return camera;
}

json propertiesToJson(const ViewportProperties& properties)
{
    json j = {
        {"invert", properties.invert},
        {"interpolation",
         properties.interpolation == InterpolationType::Nearest ? "nearest" : "linear"},
    };
    if (properties.voiRange) {
        j["voiRange"] = {{"lower", properties.voiRange->lower},
                         {"upper", properties.voiRange->upper}};
    }
    return j;
}

ViewportProperties propertiesFromJson(const json& j)
{
    ViewportProperties properties;
    properties.invert = j.value("invert", false);
    properties.interpolation = j.value("interpolation", std::string("linear")) == "nearest"
        ? InterpolationType::Nearest
        : InterpolationType::Linear;
    if (j.contains("voiRange")) {
        const auto& voi = j.at("voiRange");
        properties.voiRange = VoiRange{voi.at("lower").get<double>(),
                                       voi.at("upper").get<double>()};
    }
    return properties;
}

json snapshotToJson(const ViewportStateSnapshot& snapshot)
{
    json j = {
        {"index", snapshot.index},
        {"viewportId", snapshot.viewportId},
        {"isActive", snapshot.isActive},
    };
    if (snapshot.camera) {
        j["camera"] = cameraToJson(*snapshot.camera);
    }
    if (snapshot.properties) {
        j["properties"] = propertiesToJson(*snapshot.properties);
    }
    if (snapshot.imageId) {
        j["imageId"] = *snapshot.imageId;
    }
    return j;
}

ViewportStateSnapshot snapshotFromJson(const json& j)
{
    ViewportStateSnapshot snapshot;
    snapshot.index = j.at("index").get<int>();
    snapshot.viewportId = j.at("viewportId").get<std::string>();
    snapshot.isActive = j.value("isActive", false);
    if (j.contains("camera")) {
        snapshot.camera = cameraFromJson(j.at("camera"));
    }
    if (j.contains("properties")) {
        snapshot.properties = propertiesFromJson(j.at("properties"));
    }
    if (j.contains("imageId")) {
        snapshot.imageId = j.at("imageId").get<std::string>();
    }
    return snapshot;
}

json syncGroupToJson(const SyncGroup& group)
{
    json types = json::array();
    for (auto type : group.syncTypes) {
        types.push_back(std::string(syncTypeName(type)));
    }
    return {
        {"id", group.id},
        {"viewports", group.members},
        {"active", group.active},
        {"syncTypes", types},
    };
}

SyncGroup syncGroupFromJson(const json& j)
{
    SyncGroup group;
    group.id = j.at("id").get<std::string>();
    group.members = j.value("viewports", std::vector<std::string>{});
    group.active = j.value("active", true);
    for (const auto& name : j.value("syncTypes", std::vector<std::string>{})) {
        if (auto type = syncTypeFromName(name)) {
            group.syncTypes.insert(*type);
        } else {
            getLogger()->warn("Ignoring unknown sync type '{}' in group {}", name, group.id);
        }
    }
    return group;
}

json stateToJson(const StoredLayoutState& state)
{
    json viewports = json::array();
    for (const auto& snapshot : state.viewports) {
        viewports.push_back(snapshotToJson(snapshot));
    }
    json groups = json::array();
    for (const auto& group : state.syncGroups) {
        groups.push_back(syncGroupToJson(group));
    }
    return {
        {"id", state.id},
        {"name", state.name},
        {"layout", {{"name", state.layoutName}, {"rows", state.rows}, {"cols", state.cols}}},
        {"activeIndex", state.activeIndex},
        {"viewports", viewports},
        {"synchronization", groups},
        {"createdAt", state.createdAt},
        {"lastUsed", state.lastUsed},
    };
}

bool isValidStateJson(const json& j)
{
    return j.is_object()
        && j.contains("id") && j.at("id").is_string()
        && j.contains("name") && j.at("name").is_string()
        && j.contains("layout") && j.at("layout").is_object()
        && j.at("layout").contains("rows") && j.at("layout").at("rows").is_number_integer()
        && j.at("layout").contains("cols") && j.at("layout").at("cols").is_number_integer()
        && j.contains("viewports") && j.at("viewports").is_array()
        && j.contains("synchronization") && j.at("synchronization").is_array()
        && j.contains("createdAt") && j.at("createdAt").is_string()
        && j.contains("lastUsed") && j.at("lastUsed").is_string();
}

StoredLayoutState stateFromJson(const json& j)
{
    StoredLayoutState state;
    state.id = j.at("id").get<std::string>();
    state.name = j.at("name").get<std::string>();
    const auto& layout = j.at("layout");
    state.rows = layout.at("rows").get<int>();
    state.cols = layout.at("cols").get<int>();
    state.layoutName = layout.value("name", std::format("{}x{}", state.rows, state.cols));
    state.activeIndex = j.value("activeIndex", 0);
    for (const auto& snapshot : j.at("viewports")) {
        state.viewports.push_back(snapshotFromJson(snapshot));
    }
    for (const auto& group : j.at("synchronization")) {
        state.syncGroups.push_back(syncGroupFromJson(group));
    }
    state.createdAt = j.at("createdAt").get<std::string>();
    state.lastUsed = j.at("lastUsed").get<std::string>();
    return state;
}

} // anonymous namespace

// ============================================================================
// Implementation Class
// ============================================================================

class LayoutStatePersistence::Impl {
public:
    IPersistenceService& persistence;
    size_t maxStoredLayouts;
    std::uint64_t sequence = 0;

    Impl(IPersistenceService& service, size_t maxLayouts)
        : persistence(service), maxStoredLayouts(std::max<size_t>(1, maxLayouts)) {}

    std::string generateId() {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return std::format("layout-{}-{}", ms, ++sequence);
    }

    std::vector<StoredLayoutState> readStates() const {
        auto raw = persistence.retrieve(kLayoutStateKey);
        if (!raw || raw->empty()) {
            return {};
        }

        std::vector<StoredLayoutState> states;
        try {
            auto j = json::parse(*raw);
            if (!j.is_array()) {
                getLogger()->warn("Stored layout states are not an array, ignoring");
                return {};
            }
            for (const auto& entry : j) {
                if (isValidStateJson(entry)) {
                    states.push_back(stateFromJson(entry));
                }
            }
        } catch (const json::exception& e) {
            getLogger()->warn("Failed to read stored layout states: {}", e.what());
            return {};
        }
        return states;
    }

    bool writeStates(std::vector<StoredLayoutState> states) {
        if (states.size() > maxStoredLayouts) {
            states.resize(maxStoredLayouts);
        }
        json j = json::array();
        for (const auto& state : states) {
            j.push_back(stateToJson(state));
        }
        return persistence.store(kLayoutStateKey, j.dump(), "layout-state");
    }
};

// ============================================================================
// LayoutStatePersistence
// ============================================================================

LayoutStatePersistence::LayoutStatePersistence(IPersistenceService& persistence,
                                               size_t maxStoredLayouts)
    : impl_(std::make_unique<Impl>(persistence, maxStoredLayouts))
{
}

LayoutStatePersistence::~LayoutStatePersistence() = default;

std::expected<std::string, ViewportError> LayoutStatePersistence::saveLayoutState(
    const std::string& name, StoredLayoutState state)
{
    state.id = impl_->generateId();
    state.name = name;
    state.createdAt = currentTimestamp();
    state.lastUsed = state.createdAt;

    auto states = impl_->readStates();
    states.insert(states.begin(), state);

    if (!impl_->writeStates(std::move(states))) {
        getLogger()->error("Failed to save layout state '{}'", name);
        return std::unexpected(ViewportError{
            ViewportError::Code::PersistenceFailure,
            std::format("could not store layout state '{}'", name)});
    }

    getLogger()->info("Layout state saved: name='{}', id={}", name, state.id);
    return state.id;
}

std::optional<StoredLayoutState> LayoutStatePersistence::loadLayoutState(const std::string& id)
{
    auto states = impl_->readStates();
    auto it = std::find_if(states.begin(), states.end(),
        [&id](const StoredLayoutState& s) { return s.id == id; });
    if (it == states.end()) {
        getLogger()->warn("Layout state {} not found", id);
        return std::nullopt;
    }

    it->lastUsed = currentTimestamp();
    StoredLayoutState loaded = *it;
    if (!impl_->writeStates(std::move(states))) {
        getLogger()->warn("Failed to refresh last-used timestamp of {}", id);
    }
    return loaded;
}

std::vector<StoredLayoutState> LayoutStatePersistence::getAllStoredStates() const
{
    return impl_->readStates();
}

bool LayoutStatePersistence::deleteLayoutState(const std::string& id)
{
    auto states = impl_->readStates();
    auto removed = std::erase_if(states,
        [&id](const StoredLayoutState& s) { return s.id == id; });
    if (removed == 0) {
        return false;
    }
    if (!impl_->writeStates(std::move(states))) {
        getLogger()->error("Failed to delete layout state {}", id);
        return false;
    }
    return true;
}

bool LayoutStatePersistence::clearAllStates()
{
    impl_->persistence.remove(kLayoutStateKey);
    return !impl_->persistence.retrieve(kLayoutStateKey).has_value();
}

std::string LayoutStatePersistence::exportLayoutStates() const
{
    json j = json::array();
    for (const auto& state : impl_->readStates()) {
        j.push_back(stateToJson(state));
    }
    return j.dump(2);
}

std::expected<size_t, ViewportError> LayoutStatePersistence::importLayoutStates(
    const std::string& data)
{
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        getLogger()->error("Failed to parse imported layout states: {}", e.what());
        return std::unexpected(ViewportError{
            ViewportError::Code::InvalidLayoutConfig, e.what()});
    }

    if (!j.is_array()) {
        return std::unexpected(ViewportError{
            ViewportError::Code::InvalidLayoutConfig, "import data is not an array"});
    }

    std::vector<StoredLayoutState> imported;
    for (const auto& entry : j) {
        if (!isValidStateJson(entry)) {
            continue;
        }
        try {
            imported.push_back(stateFromJson(entry));
        } catch (const json::exception& e) {
            getLogger()->warn("Skipping malformed layout state: {}", e.what());
        }
    }

    if (imported.empty()) {
        return std::unexpected(ViewportError{
            ViewportError::Code::InvalidLayoutConfig,
            "no valid layout states found in import data"});
    }

    size_t count = imported.size();
    auto existing = impl_->readStates();
    imported.insert(imported.end(), existing.begin(), existing.end());

    if (!impl_->writeStates(std::move(imported))) {
        return std::unexpected(ViewportError{
            ViewportError::Code::PersistenceFailure, "could not store imported layout states"});
    }

    getLogger()->info("Imported {} layout states", count);
    return count;
}

bool LayoutStatePersistence::saveSyncSettings(const std::vector<SyncGroup>& groups)
{
    json j = json::array();
    for (const auto& group : groups) {
        j.push_back(syncGroupToJson(group));
    }
    return impl_->persistence.store(kSyncSettingsKey, j.dump(), "sync-settings");
}

std::vector<SyncGroup> LayoutStatePersistence::loadSyncSettings() const
{
    auto raw = impl_->persistence.retrieve(kSyncSettingsKey);
    if (!raw || raw->empty()) {
        return {};
    }

    std::vector<SyncGroup> groups;
    try {
        for (const auto& entry : json::parse(*raw)) {
            groups.push_back(syncGroupFromJson(entry));
        }
    } catch (const json::exception& e) {
        getLogger()->warn("Failed to read sync settings: {}", e.what());
        return {};
    }
    return groups;
}

size_t LayoutStatePersistence::maxStoredLayouts() const noexcept
{
    return impl_->maxStoredLayouts;
}

void LayoutStatePersistence::setMaxStoredLayouts(size_t maxStoredLayouts)
{
    impl_->maxStoredLayouts = std::max<size_t>(1, maxStoredLayouts);
}

}  // namespace viewport_coordinator::services
