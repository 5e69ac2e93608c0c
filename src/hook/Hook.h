#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief Claude Code hook 协议的数据结构
 *
 * 输入 (stdin):
 * {
 *   "session_id": "...", "transcript_path": "...", "cwd": "...",
 *   "hook_event_name": "PreToolUse" | "PostToolUse" | "UserPromptSubmit",
 *   "tool_name": "Edit", "tool_input": { "file_path": "..." }   // 工具事件
 *   "prompt": "..."                                              // UserPromptSubmit
 * }
 *
 * 输出 (stdout): 见 HookOutput::toJson
 */

// 顶层 payload 解码失败。这是唯一允许中止进程的错误。
class HookParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class HookEvent {
    PreToolUse,
    PostToolUse,
    UserPromptSubmit
};

std::string hookEventName(HookEvent event);

// Read / Write / Edit / MultiEdit 共用的输入
struct FileToolInput {
    std::string filePath;
    std::optional<std::string> content;
    std::optional<std::string> oldString;
    std::optional<std::string> newString;
    nlohmann::json edits;  // MultiEdit 的 edits 数组，其余工具为 null
};

struct ReadTool { FileToolInput input; };
struct WriteTool { FileToolInput input; };
struct EditTool { FileToolInput input; };
struct MultiEditTool { FileToolInput input; };

struct BashTool {
    std::string command;
    std::string description;
};

// 未知工具名: 原样保留，按非修改类处理
struct UnknownTool {
    std::string name;
    nlohmann::json input;
};

using ToolCall = std::variant<ReadTool, WriteTool, EditTool, MultiEditTool, BashTool, UnknownTool>;

std::string toolName(const ToolCall& tool);

/**
 * @brief 修改类工具 (Write / Edit / MultiEdit) 的目标文件，其他工具返回空列表
 */
std::vector<std::string> modificationTargets(const ToolCall& tool);

struct HookInput {
    std::string sessionId;
    std::string transcriptPath;
    std::string cwd;
    HookEvent event = HookEvent::PreToolUse;
    std::optional<ToolCall> tool;  // 仅工具事件
    std::string prompt;            // 仅 UserPromptSubmit
};

/**
 * @throws HookParseError JSON 无效、根不是对象、缺少必填字段或事件名未知
 */
HookInput parseHook(const std::string& text);

enum class PermissionDecision {
    Allow,
    Deny,
    Ask
};

std::string permissionDecisionName(PermissionDecision decision);

struct HookSpecificOutput {
    std::string hookEventName;
    // PreToolUse
    std::optional<PermissionDecision> permissionDecision;
    std::optional<std::string> permissionDecisionReason;
    // PostToolUse / UserPromptSubmit
    std::optional<std::string> additionalContext;
};

/**
 * @brief hook 输出
 *
 * 所有字段可选，未设置的字段不序列化，因此默认输出为 "{}"，
 * 即不表态，交由宿主正常的权限流程处理。
 */
struct HookOutput {
    std::optional<bool> continueExecution;
    std::optional<std::string> stopReason;
    std::optional<bool> suppressOutput;
    std::optional<std::string> systemMessage;
    std::optional<HookSpecificOutput> hookSpecificOutput;

    HookOutput& withPermissionDecision(PermissionDecision decision, std::optional<std::string> reason);
    HookOutput& withAdditionalContext(HookEvent event, std::string context);
    HookOutput& withSystemMessage(std::string message);

    // 未显式给出决定时视为 Allow
    PermissionDecision effectiveDecision() const;

    nlohmann::json toJson() const;
};
