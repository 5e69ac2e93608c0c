#include "hook/Hook.h"

namespace {
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const nlohmann::json& requireField(const nlohmann::json& obj, const char* key, const char* where) {
    if (!obj.contains(key)) {
        throw HookParseError(std::string("Missing field '") + key + "' in " + where);
    }
    return obj.at(key);
}

std::string requireString(const nlohmann::json& obj, const char* key, const char* where) {
    const auto& value = requireField(obj, key, where);
    if (!value.is_string()) {
        throw HookParseError(std::string("Field '") + key + "' in " + where + " must be a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj.at(key).is_string()) {
        return obj.at(key).get<std::string>();
    }
    return std::nullopt;
}

FileToolInput parseFileToolInput(const nlohmann::json& input) {
    FileToolInput parsed;
    parsed.filePath = requireString(input, "file_path", "tool_input");
    parsed.content = optionalString(input, "content");
    parsed.oldString = optionalString(input, "old_string");
    parsed.newString = optionalString(input, "new_string");
    if (input.contains("edits")) {
        parsed.edits = input.at("edits");
    }
    return parsed;
}

ToolCall parseToolCall(const std::string& name, const nlohmann::json& input) {
    if (name == "Bash") {
        if (!input.is_object()) throw HookParseError("tool_input for Bash must be an object");
        BashTool bash;
        bash.command = requireString(input, "command", "tool_input");
        bash.description = optionalString(input, "description").value_or("");
        return bash;
    }
    if (name == "Read" || name == "Write" || name == "Edit" || name == "MultiEdit") {
        if (!input.is_object()) throw HookParseError("tool_input for " + name + " must be an object");
        FileToolInput file = parseFileToolInput(input);
        if (name == "Read") return ReadTool{std::move(file)};
        if (name == "Write") return WriteTool{std::move(file)};
        if (name == "Edit") return EditTool{std::move(file)};
        return MultiEditTool{std::move(file)};
    }
    return UnknownTool{name, input};
}

HookEvent parseEvent(const std::string& name) {
    if (name == "PreToolUse") return HookEvent::PreToolUse;
    if (name == "PostToolUse") return HookEvent::PostToolUse;
    if (name == "UserPromptSubmit") return HookEvent::UserPromptSubmit;
    throw HookParseError("Unknown hook_event_name: " + name);
}
} // namespace

std::string hookEventName(HookEvent event) {
    switch (event) {
        case HookEvent::PreToolUse: return "PreToolUse";
        case HookEvent::PostToolUse: return "PostToolUse";
        case HookEvent::UserPromptSubmit: return "UserPromptSubmit";
    }
    return "PreToolUse";
}

std::string permissionDecisionName(PermissionDecision decision) {
    switch (decision) {
        case PermissionDecision::Allow: return "allow";
        case PermissionDecision::Deny: return "deny";
        case PermissionDecision::Ask: return "ask";
    }
    return "allow";
}

std::string toolName(const ToolCall& tool) {
    return std::visit(overloaded{
        [](const ReadTool&) { return std::string("Read"); },
        [](const WriteTool&) { return std::string("Write"); },
        [](const EditTool&) { return std::string("Edit"); },
        [](const MultiEditTool&) { return std::string("MultiEdit"); },
        [](const BashTool&) { return std::string("Bash"); },
        [](const UnknownTool& t) { return t.name; },
    }, tool);
}

std::vector<std::string> modificationTargets(const ToolCall& tool) {
    return std::visit(overloaded{
        [](const ReadTool&) { return std::vector<std::string>{}; },
        [](const WriteTool& t) { return std::vector<std::string>{t.input.filePath}; },
        [](const EditTool& t) { return std::vector<std::string>{t.input.filePath}; },
        [](const MultiEditTool& t) { return std::vector<std::string>{t.input.filePath}; },
        [](const BashTool&) { return std::vector<std::string>{}; },
        [](const UnknownTool&) { return std::vector<std::string>{}; },
    }, tool);
}

HookInput parseHook(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw HookParseError(std::string("Invalid JSON for Hook: ") + e.what());
    }
    if (!j.is_object()) {
        throw HookParseError("Hook payload must be a JSON object");
    }

    HookInput hook;
    hook.sessionId = requireString(j, "session_id", "hook");
    hook.transcriptPath = requireString(j, "transcript_path", "hook");
    hook.cwd = requireString(j, "cwd", "hook");
    hook.event = parseEvent(requireString(j, "hook_event_name", "hook"));

    if (hook.event == HookEvent::UserPromptSubmit) {
        hook.prompt = optionalString(j, "prompt").value_or("");
        return hook;
    }

    std::string name = requireString(j, "tool_name", "hook");
    hook.tool = parseToolCall(name, requireField(j, "tool_input", "hook"));
    return hook;
}

HookOutput& HookOutput::withPermissionDecision(PermissionDecision decision, std::optional<std::string> reason) {
    HookSpecificOutput specific;
    specific.hookEventName = hookEventName(HookEvent::PreToolUse);
    specific.permissionDecision = decision;
    specific.permissionDecisionReason = std::move(reason);
    hookSpecificOutput = std::move(specific);
    return *this;
}

HookOutput& HookOutput::withAdditionalContext(HookEvent event, std::string context) {
    HookSpecificOutput specific;
    specific.hookEventName = hookEventName(event);
    specific.additionalContext = std::move(context);
    hookSpecificOutput = std::move(specific);
    return *this;
}

HookOutput& HookOutput::withSystemMessage(std::string message) {
    systemMessage = std::move(message);
    return *this;
}

PermissionDecision HookOutput::effectiveDecision() const {
    if (hookSpecificOutput && hookSpecificOutput->permissionDecision) {
        return *hookSpecificOutput->permissionDecision;
    }
    return PermissionDecision::Allow;
}

nlohmann::json HookOutput::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    if (continueExecution) j["continue"] = *continueExecution;
    if (stopReason) j["stopReason"] = *stopReason;
    if (suppressOutput) j["suppressOutput"] = *suppressOutput;
    if (systemMessage) j["systemMessage"] = *systemMessage;

    if (hookSpecificOutput) {
        nlohmann::json specific = {{"hookEventName", hookSpecificOutput->hookEventName}};
        if (hookSpecificOutput->permissionDecision) {
            specific["permissionDecision"] = permissionDecisionName(*hookSpecificOutput->permissionDecision);
        }
        if (hookSpecificOutput->permissionDecisionReason) {
            specific["permissionDecisionReason"] = *hookSpecificOutput->permissionDecisionReason;
        }
        if (hookSpecificOutput->additionalContext) {
            specific["additionalContext"] = *hookSpecificOutput->additionalContext;
        }
        j["hookSpecificOutput"] = specific;
    }
    return j;
}
