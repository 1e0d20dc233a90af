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
 * @file annotation_types.hpp
 * @brief Annotation records and the transition snapshots built from them
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace viewport_coordinator::services {

/**
 * @brief Measurement or markup attached to an image in a viewport
 */
struct Annotation {
    std::string annotationId;
    std::string toolName;

    /// Frame of reference or image identifier the annotation belongs to
    std::string frameKey;

    /// Viewport the annotation was drawn in
    std::string viewportId;

    /// Tool-specific geometry (handles, text, ...)
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Annotation captured before a layout transition
 *
 * The payload holds the annotation's data and metadata as
 * {"data": ..., "metadata": ...}.
 */
struct AnnotationSnapshot {
    std::string annotationId;
    std::string toolName;
    nlohmann::json payload = nlohmann::json::object();
    std::string sourceViewportId;
    std::string imageId;
};

/**
 * @brief Every annotation captured for one layout transition
 */
struct AnnotationTransitionState {
    std::vector<AnnotationSnapshot> annotations;
    std::chrono::system_clock::time_point capturedAt = std::chrono::system_clock::now();

    [[nodiscard]] bool empty() const noexcept { return annotations.empty(); }
    [[nodiscard]] size_t size() const noexcept { return annotations.size(); }
};

/**
 * @brief Build a snapshot from a live annotation
 */
[[nodiscard]] AnnotationSnapshot makeSnapshot(const Annotation& annotation);

/**
 * @brief Rebuild an annotation from a snapshot, targeting another viewport
 */
[[nodiscard]] Annotation fromSnapshot(const AnnotationSnapshot& snapshot,
                                      const std::string& targetViewportId);

}  // namespace viewport_coordinator::services
