#include "handler/HookHandler.h"
#include "discovery/InstanceDiscovery.h"
#include "utils/Logger.h"
#include "utils/PathUtils.h"
#include <algorithm>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

HookHandlerOptions HookHandlerOptions::fromConfig(const Config& cfg) {
    HookHandlerOptions options;
    options.socketDir = cfg.discovery.socketDir;
    options.timeout = std::chrono::milliseconds(cfg.rpc.timeoutMs);
    options.notifyOnDeny = cfg.hook.notifyOnDeny;
    options.denyNotice = cfg.hook.denyNotice;
    options.refreshAfterEdit = cfg.hook.refreshAfterEdit;
    options.injectSelection = cfg.hook.injectSelection;
    return options;
}

HookHandler::HookHandler(HookHandlerOptions options) : options(std::move(options)) {}

std::vector<EditorInstance> HookHandler::discoverInstances(const std::string& cwd) const {
    std::string workDir = !options.workDirOverride.empty() ? options.workDirOverride : cwd;
    return InstanceDiscovery(options.socketDir, workDir).discover();
}

std::string HookHandler::formatSelection(const SelectionContext& ctx) {
    std::ostringstream oss;
    oss << "[Selected from " << ctx.filePath << ":" << ctx.startLine << "-" << ctx.endLine << "]\n"
        << "```\n" << ctx.content << "\n```";
    return oss.str();
}

PermissionResult HookHandler::evaluate(const ToolCall& tool, const std::string& cwd,
                                       std::vector<BroadcastHandle>* sideEffects) const {
    auto targets = modificationTargets(tool);
    if (targets.empty()) {
        return PermissionResult{};
    }

    auto instances = discoverInstances(cwd);
    if (instances.empty()) {
        Logger::getInstance().debug("No editor instances for " + toolName(tool) + ", allowing");
        return PermissionResult{};
    }

    InstanceFanOut fanOut(std::move(instances), options.timeout);
    for (const auto& target : targets) {
        const std::string canonical = canonicalizePath(target, cwd);
        auto aggregated = fanOut.bufferStatus(canonical);
        if (!aggregated.blocked) {
            continue;
        }

        const std::string kind = aggregated.blockingKind ? editorKindName(*aggregated.blockingKind) : "an editor";
        PermissionResult result;
        result.decision = PermissionDecision::Deny;
        result.reason = "The file " + canonical + " is being edited by the user in " + kind +
                        " and has unsaved changes, try again later";
        Logger::getInstance().info("Denied " + toolName(tool) + " on " + canonical + " (" + kind + ")");

        if (options.notifyOnDeny && sideEffects) {
            sideEffects->push_back(fanOut.sendMessage(options.denyNotice + ": " + canonical));
        }
        return result;
    }
    return PermissionResult{};
}

HookResult HookHandler::handlePreToolUse(const ToolCall& tool, const std::string& cwd) const {
    HookResult result;
    auto permission = evaluate(tool, cwd, &result.sideEffects);
    if (permission.decision != PermissionDecision::Allow) {
        result.output.withPermissionDecision(permission.decision, permission.reason);
    }
    return result;
}

HookResult HookHandler::handlePostToolUse(const ToolCall& tool, const std::string& cwd) const {
    HookResult result;
    if (!options.refreshAfterEdit) {
        return result;
    }

    auto targets = modificationTargets(tool);
    if (targets.empty()) {
        return result;
    }

    auto instances = discoverInstances(cwd);
    if (instances.empty()) {
        return result;
    }

    // 与修改前的决定无关，所有实例都刷新
    InstanceFanOut fanOut(std::move(instances), options.timeout);
    for (const auto& target : targets) {
        result.sideEffects.push_back(fanOut.refreshBuffer(canonicalizePath(target, cwd)));
    }
    return result;
}

HookResult HookHandler::handleUserPromptSubmit(const std::string& cwd) const {
    HookResult result;
    if (!options.injectSelection) {
        return result;
    }

    auto instances = discoverInstances(cwd);
    if (instances.empty()) {
        return result;
    }

    InstanceFanOut fanOut(std::move(instances), options.timeout);
    auto selection = fanOut.getVisualSelection();
    if (selection) {
        result.output.withAdditionalContext(HookEvent::UserPromptSubmit, formatSelection(*selection));
    }
    return result;
}

HookResult HookHandler::handle(const HookInput& hook) const {
    switch (hook.event) {
        case HookEvent::PreToolUse:
            return hook.tool ? handlePreToolUse(*hook.tool, hook.cwd) : HookResult{};
        case HookEvent::PostToolUse:
            return hook.tool ? handlePostToolUse(*hook.tool, hook.cwd) : HookResult{};
        case HookEvent::UserPromptSubmit:
            return handleUserPromptSubmit(hook.cwd);
    }
    return HookResult{};
}

void HookHandler::run(std::istream& in, std::ostream& out) const {
    std::string input((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    HookInput hook = parseHook(input);

    Logger::getInstance().debug("Hook " + hookEventName(hook.event) +
                                (hook.tool ? " " + toolName(*hook.tool) : std::string()) + " in " + hook.cwd);

    HookResult result = handle(hook);
    // 选区或路径可能不是合法 UTF-8，非法字节替换为 U+FFFD 而不是抛出
    out << result.output.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out.flush();

    // 决定已写出；所有副作用合计最多再等一个单实例时限
    const auto deadline = std::chrono::steady_clock::now() + options.timeout + kJoinGrace;
    for (auto& effect : result.sideEffects) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        size_t done = effect.waitFor(std::max(remaining, std::chrono::milliseconds(0)));
        Logger::getInstance().debug("Side effect finished on " + std::to_string(done) + "/" +
                                    std::to_string(effect.size()) + " instance(s)");
    }
}
