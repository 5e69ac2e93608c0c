#include "action/EditorAction.h"

EditorAction::EditorAction(const EditorInstance& instance, std::chrono::milliseconds timeout)
    : backend(makeBackend(instance, timeout)) {}

EditorAction::Backend EditorAction::makeBackend(const EditorInstance& instance, std::chrono::milliseconds timeout) {
    switch (instance.kind) {
        case EditorKind::Neovim:
            return NeovimAction(instance.socketPath, timeout);
        case EditorKind::VSCode:
            return VSCodeAction(instance.socketPath, timeout);
    }
    return NeovimAction(instance.socketPath, timeout);
}

BufferStatus EditorAction::bufferStatus(const std::string& canonicalPath) const {
    return std::visit([&](const auto& action) { return action.bufferStatus(canonicalPath); }, backend);
}

bool EditorAction::refreshBuffer(const std::string& canonicalPath) const {
    return std::visit([&](const auto& action) { return action.refreshBuffer(canonicalPath); }, backend);
}

bool EditorAction::sendMessage(const std::string& message) const {
    return std::visit([&](const auto& action) { return action.sendMessage(message); }, backend);
}

std::optional<SelectionContext> EditorAction::getVisualSelection() const {
    return std::visit([](const auto& action) { return action.getVisualSelection(); }, backend);
}
