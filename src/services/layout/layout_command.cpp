#include "services/layout/layout_command.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace viewport_coordinator::services {

// =============================================================================
// LayoutSwitchCommand
// =============================================================================

LayoutSwitchCommand::LayoutSwitchCommand(std::string fromLayout, std::string toLayout,
                                         ApplyFunction apply)
    : from_(std::move(fromLayout))
    , to_(std::move(toLayout))
    , apply_(std::move(apply))
{
}

void LayoutSwitchCommand::execute()
{
    if (apply_) {
        apply_(to_);
    }
}

void LayoutSwitchCommand::undo()
{
    if (apply_) {
        apply_(from_);
    }
}

std::string LayoutSwitchCommand::description() const
{
    return std::format("{} -> {}", from_, to_);
}

// =============================================================================
// LayoutCommandStack
// =============================================================================

LayoutCommandStack::LayoutCommandStack(size_t maxHistory)
    : maxHistory_(std::max(size_t{1}, maxHistory))
{
}

LayoutCommandStack::~LayoutCommandStack() = default;

void LayoutCommandStack::execute(std::unique_ptr<ILayoutCommand> command)
{
    if (!command) return;

    command->execute();
    undoStack_.push_back(std::move(command));

    // New command invalidates redo history
    redoStack_.clear();

    trimUndoStack();
    notifyAvailability();
}

bool LayoutCommandStack::undo()
{
    if (undoStack_.empty()) return false;

    auto command = std::move(undoStack_.back());
    undoStack_.pop_back();

    command->undo();
    redoStack_.push_back(std::move(command));

    notifyAvailability();
    return true;
}

bool LayoutCommandStack::redo()
{
    if (redoStack_.empty()) return false;

    auto command = std::move(redoStack_.back());
    redoStack_.pop_back();

    command->execute();
    undoStack_.push_back(std::move(command));

    notifyAvailability();
    return true;
}

bool LayoutCommandStack::canUndo() const noexcept
{
    return !undoStack_.empty();
}

bool LayoutCommandStack::canRedo() const noexcept
{
    return !redoStack_.empty();
}

size_t LayoutCommandStack::undoCount() const noexcept
{
    return undoStack_.size();
}

size_t LayoutCommandStack::redoCount() const noexcept
{
    return redoStack_.size();
}

void LayoutCommandStack::clear()
{
    undoStack_.clear();
    redoStack_.clear();
    notifyAvailability();
}

size_t LayoutCommandStack::maxHistorySize() const noexcept
{
    return maxHistory_;
}

void LayoutCommandStack::setMaxHistorySize(size_t maxHistory)
{
    maxHistory_ = std::max(size_t{1}, maxHistory);
    trimUndoStack();
    notifyAvailability();
}

std::vector<std::string> LayoutCommandStack::undoDescriptions() const
{
    std::vector<std::string> descriptions;
    descriptions.reserve(undoStack_.size());
    for (const auto& command : undoStack_) {
        descriptions.push_back(command->description());
    }
    return descriptions;
}

void LayoutCommandStack::setAvailabilityCallback(AvailabilityCallback callback)
{
    availabilityCallback_ = std::move(callback);
}

void LayoutCommandStack::notifyAvailability()
{
    if (availabilityCallback_) {
        availabilityCallback_(canUndo(), canRedo());
    }
}

void LayoutCommandStack::trimUndoStack()
{
    while (undoStack_.size() > maxHistory_) {
        undoStack_.pop_front();
    }
}

} // namespace viewport_coordinator::services
