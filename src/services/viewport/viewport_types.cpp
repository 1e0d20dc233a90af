#include "services/viewport/viewport_types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace viewport_coordinator::services {

namespace {

constexpr std::array<std::pair<SyncType, std::string_view>, 6> kSyncTypeNames = {{
    {SyncType::Pan, "pan"},
    {SyncType::Zoom, "zoom"},
    {SyncType::WindowLevel, "windowLevel"},
    {SyncType::Rotation, "rotation"},
    {SyncType::Flip, "flip"},
    {SyncType::Camera, "camera"},
}};

} // anonymous namespace

std::string_view syncTypeName(SyncType type) noexcept
{
    for (const auto& [value, name] : kSyncTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<SyncType> syncTypeFromName(std::string_view name) noexcept
{
    for (const auto& [value, candidate] : kSyncTypeNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool SyncGroup::contains(const std::string& viewportId) const
{
    return std::find(members.begin(), members.end(), viewportId) != members.end();
}

} // namespace viewport_coordinator::services
