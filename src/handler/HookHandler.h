#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <iosfwd>
#include <optional>
#include "hook/Hook.h"
#include "action/ActionTypes.h"
#include "action/InstanceFanOut.h"
#include "core/ConfigManager.h"

struct HookHandlerOptions {
    std::string socketDir = kDefaultSocketDir;
    std::chrono::milliseconds timeout = kRpcTimeout;
    bool notifyOnDeny = true;
    std::string denyNotice = kDefaultDenyNotice;
    bool refreshAfterEdit = true;
    bool injectSelection = true;
    // 为空时使用 hook 的 cwd，再退化为进程当前目录
    std::string workDirOverride;

    static HookHandlerOptions fromConfig(const Config& cfg);
};

struct PermissionResult {
    PermissionDecision decision = PermissionDecision::Allow;
    std::string reason;
};

/**
 * @brief 一次 hook 调用的处理结果
 *
 * sideEffects 是已分发但未必完成的广播 (refresh / notify)，
 * 由调用方在输出决定之后做有界等待。
 */
struct HookResult {
    HookOutput output;
    std::vector<BroadcastHandle> sideEffects;
};

/**
 * @brief Claude Code hook 处理器
 *
 * 每次调用无状态: decode -> discover -> query -> decide -> respond。
 *
 * 1. PreToolUse: 目标文件在任一实例中是“当前缓冲区且未保存” -> Deny，否则 Allow
 * 2. PostToolUse: 在所有实例中从磁盘刷新被修改的文件
 * 3. UserPromptSubmit: 有可视选区时作为 additionalContext 注入
 */
class HookHandler {
public:
    explicit HookHandler(HookHandlerOptions options = HookHandlerOptions{});

    HookResult handle(const HookInput& hook) const;

    /**
     * @brief 修改前检查。非修改类工具直接 Allow，不接触任何实例。
     */
    PermissionResult evaluate(const ToolCall& tool, const std::string& cwd,
                              std::vector<BroadcastHandle>* sideEffects = nullptr) const;

    /**
     * @brief 从 in 读取 payload，向 out 写出结果，再等待副作用 (有界)
     * @throws HookParseError payload 无法解码时，此时不写出任何决定
     */
    void run(std::istream& in, std::ostream& out) const;

    static std::string formatSelection(const SelectionContext& ctx);

private:
    HookHandlerOptions options;

    std::vector<EditorInstance> discoverInstances(const std::string& cwd) const;
    HookResult handlePreToolUse(const ToolCall& tool, const std::string& cwd) const;
    HookResult handlePostToolUse(const ToolCall& tool, const std::string& cwd) const;
    HookResult handleUserPromptSubmit(const std::string& cwd) const;
};
