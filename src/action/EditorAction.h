#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include "action/ActionTypes.h"
#include "action/NeovimAction.h"
#include "action/VSCodeAction.h"
#include "core/Constants.h"

/**
 * @brief 对单个编辑器实例的统一操作接口
 *
 * 发现阶段按 socket 标记选定后端，这里按 kind 选择具体适配器，
 * 四个操作签名对所有后端一致。所有操作都不抛异常:
 * - bufferStatus: 文件未打开或失败时为 {false, false}
 * - refreshBuffer: 文件未打开视为成功
 * - sendMessage: 在该实例中弹出用户可见的提示
 * - getVisualSelection: 无非空选区或失败时为 nullopt
 */
class EditorAction {
public:
    EditorAction(const EditorInstance& instance, std::chrono::milliseconds timeout = kRpcTimeout);

    BufferStatus bufferStatus(const std::string& canonicalPath) const;
    bool refreshBuffer(const std::string& canonicalPath) const;
    bool sendMessage(const std::string& message) const;
    std::optional<SelectionContext> getVisualSelection() const;

private:
    using Backend = std::variant<NeovimAction, VSCodeAction>;

    Backend backend;

    static Backend makeBackend(const EditorInstance& instance, std::chrono::milliseconds timeout);
};
