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


#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace viewport_coordinator::services {

/**
 * @brief Abstract interface for undoable layout operations
 */
class ILayoutCommand {
public:
    virtual ~ILayoutCommand() = default;

    /**
     * @brief Execute or re-execute the command
     */
    virtual void execute() = 0;

    /**
     * @brief Reverse the effect of execute()
     */
    virtual void undo() = 0;

    [[nodiscard]] virtual std::string description() const = 0;
};

/**
 * @brief Switch from one named layout to another
 *
 * The switch itself is delegated to the apply function so that the command
 * stays independent of the widget hierarchy.
 */
class LayoutSwitchCommand : public ILayoutCommand {
public:
    using ApplyFunction = std::function<void(const std::string& layoutName)>;

    LayoutSwitchCommand(std::string fromLayout, std::string toLayout, ApplyFunction apply);

    void execute() override;
    void undo() override;
    [[nodiscard]] std::string description() const override;

    [[nodiscard]] const std::string& fromLayout() const noexcept { return from_; }
    [[nodiscard]] const std::string& toLayout() const noexcept { return to_; }

private:
    std::string from_;
    std::string to_;
    ApplyFunction apply_;
};

/**
 * @brief Manages undo/redo history for layout switches
 *
 * When a new command is executed after an undo, the redo stack is cleared.
 * When the undo stack exceeds the maximum size, the oldest command is discarded.
 */
class LayoutCommandStack {
public:
    /// Callback when undo/redo availability changes
    using AvailabilityCallback = std::function<void(bool canUndo, bool canRedo)>;

    /**
     * @brief Construct with specified max history size
     * @param maxHistory Maximum number of undo steps (minimum 1)
     */
    explicit LayoutCommandStack(size_t maxHistory = 10);

    ~LayoutCommandStack();

    LayoutCommandStack(const LayoutCommandStack&) = delete;
    LayoutCommandStack& operator=(const LayoutCommandStack&) = delete;

    /**
     * @brief Execute a command and push it onto the undo stack
     */
    void execute(std::unique_ptr<ILayoutCommand> command);

    /**
     * @brief Undo the most recent command
     * @return true if an undo was performed
     */
    bool undo();

    /**
     * @brief Redo the most recently undone command
     * @return true if a redo was performed
     */
    bool redo();

    [[nodiscard]] bool canUndo() const noexcept;
    [[nodiscard]] bool canRedo() const noexcept;
    [[nodiscard]] size_t undoCount() const noexcept;
    [[nodiscard]] size_t redoCount() const noexcept;

    void clear();

    [[nodiscard]] size_t maxHistorySize() const noexcept;
    void setMaxHistorySize(size_t maxHistory);

    /**
     * @brief Descriptions of undoable commands, oldest first
     */
    [[nodiscard]] std::vector<std::string> undoDescriptions() const;

    void setAvailabilityCallback(AvailabilityCallback callback);

private:
    void notifyAvailability();
    void trimUndoStack();

    std::deque<std::unique_ptr<ILayoutCommand>> undoStack_;
    std::deque<std::unique_ptr<ILayoutCommand>> redoStack_;
    size_t maxHistory_;
    AvailabilityCallback availabilityCallback_;
};

} // namespace viewport_coordinator::services
