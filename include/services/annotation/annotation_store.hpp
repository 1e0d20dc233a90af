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
 * @file annotation_store.hpp
 * @brief Annotation store contract and its in-memory implementation
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/annotation/annotation_types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class QWidget;

namespace viewport_coordinator::services {

/// Annotations grouped by frame key, then by tool name
using AnnotationIndex = std::map<std::string, std::map<std::string, std::vector<Annotation>>>;

/**
 * @brief Abstract annotation store used by layout transitions
 */
class IAnnotationStore {
public:
    virtual ~IAnnotationStore() = default;

    /**
     * @brief Every stored annotation, nested frame -> tool -> annotations
     */
    [[nodiscard]] virtual AnnotationIndex getAll() const = 0;

    /**
     * @brief Remove every annotation
     */
    virtual void removeAll() = 0;

    /**
     * @brief Insert or replace an annotation by id
     * @param annotation Annotation to store
     * @param surface Display surface the annotation is drawn on
     * @throws std::invalid_argument if surface is null or the id is empty
     */
    virtual void add(const Annotation& annotation, QWidget* surface) = 0;
};

/**
 * @brief In-memory annotation store
 */
class AnnotationStore : public IAnnotationStore {
public:
    AnnotationStore();
    ~AnnotationStore() override;

    AnnotationStore(const AnnotationStore&) = delete;
    AnnotationStore& operator=(const AnnotationStore&) = delete;

    [[nodiscard]] AnnotationIndex getAll() const override;
    void removeAll() override;
    void add(const Annotation& annotation, QWidget* surface) override;

    [[nodiscard]] size_t count() const noexcept;
    [[nodiscard]] std::optional<Annotation> find(const std::string& annotationId) const;
    bool remove(const std::string& annotationId);

    /**
     * @brief Surface the annotation was last added on, if any
     */
    [[nodiscard]] QWidget* surfaceOf(const std::string& annotationId) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace viewport_coordinator::services
