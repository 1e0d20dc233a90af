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
 * @file display_region.hpp
 * @brief Grid cell hosting one viewport's rendering surface
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <string>

#include <QWidget>

class QLabel;
class QMouseEvent;

namespace viewport_coordinator::ui {

/**
 * @brief Display region of one viewport inside the layout grid
 *
 * Carries the viewport id it is bound under and its position index. A mouse
 * press emits activated() so the owning layout can make it the active
 * viewport.
 */
class DisplayRegion : public QWidget {
    Q_OBJECT

public:
    DisplayRegion(int index, const std::string& viewportId, QWidget* parent = nullptr);
    ~DisplayRegion() override;

    [[nodiscard]] int index() const noexcept { return index_; }
    void setIndex(int index);

    [[nodiscard]] const std::string& viewportId() const noexcept { return viewportId_; }

    [[nodiscard]] bool isActive() const noexcept { return active_; }

    /**
     * @brief Update the active highlight
     */
    void setActive(bool active);

signals:
    void activated(int index);

protected:
    void mousePressEvent(QMouseEvent* event) override;

private:
    void updateLabel();

    int index_;
    std::string viewportId_;
    bool active_ = false;
    QLabel* label_ = nullptr;
};

} // namespace viewport_coordinator::ui
