// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


/**
 * @file coordinator_config.hpp
 * @brief Tunable constants of the viewport coordinator
 * @details Groups the timing constants used by deferred restoration, the
 *          cleanup scheduler interval, surface sizing and history limits.
 *          Values are persisted through QSettings under the
 *          "ViewportCoordinator" group; missing or invalid entries keep
 *          their defaults.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/app_log_level.hpp"

#include <chrono>
#include <cstddef>
#include <string>

class QSettings;

namespace viewport_coordinator::core {

/**
 * @brief How annotations are relocated when their source viewport is gone
 */
enum class AnnotationRemapPolicy {
    FirstAvailable,  ///< Move to the first viewport of the new layout
    DropUnmatched    ///< Drop with a warning unless an exact/1x1 target exists
};

/**
 * @brief Runtime configuration shared by all coordinator components
 */
struct CoordinatorConfig {
    /// Delay before viewport camera/property restoration starts
    std::chrono::milliseconds stateRestoreDelay{50};

    /// Delay before annotation restoration starts
    std::chrono::milliseconds annotationRestoreDelay{200};

    /// Interval between "is the viewport bound yet" checks
    std::chrono::milliseconds restorePollInterval{10};

    /// Poll attempts before a single viewport restore gives up
    int maxRestoreAttempts = 50;

    /// Time the preserved annotation snapshot is kept after restoration
    std::chrono::milliseconds annotationGracePeriod{500};

    /// Interval of the recurring light cleanup
    std::chrono::milliseconds autoCleanupInterval{300000};

    /// Width/height applied to zero-extent surfaces before binding
    int minimumSurfaceExtent = 200;

    /// Maximum number of undoable layout switches
    std::size_t layoutHistoryLimit = 10;

    /// Maximum number of named layout states kept by persistence
    std::size_t maxStoredLayouts = 10;

    std::string defaultLayout = "1x1";

    AnnotationRemapPolicy remapPolicy = AnnotationRemapPolicy::FirstAvailable;

    AppLogLevel logLevel = AppLogLevel::Information;

    /**
     * @brief Check that every value is usable
     */
    [[nodiscard]] bool isValid() const;
};

/**
 * @brief Read configuration from settings, keeping defaults for bad entries
 */
[[nodiscard]] CoordinatorConfig loadCoordinatorConfig(QSettings& settings);

/**
 * @brief Write configuration to settings
 */
void saveCoordinatorConfig(QSettings& settings, const CoordinatorConfig& config);

[[nodiscard]] std::string to_string(AnnotationRemapPolicy policy);

[[nodiscard]] AnnotationRemapPolicy remap_policy_from_string(const std::string& str);

}  // namespace viewport_coordinator::core
