#include "action/VSCodeAction.h"
#include "action/UnixSocket.h"
#include "utils/Logger.h"

VSCodeAction::VSCodeAction(std::string socketPath, std::chrono::milliseconds timeout)
    : socketPath(std::move(socketPath)), timeout(timeout) {}

std::string VSCodeAction::encodeRequest(int id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json request = {
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request.dump();
}

nlohmann::json VSCodeAction::call(const std::string& method, const nlohmann::json& params) const {
    const auto deadline = UnixSocket::Clock::now() + timeout;
    // 每个连接只发一个请求，id 从 1 开始即可
    const int requestId = 1;

    UnixSocket sock = UnixSocket::connect(socketPath, deadline);
    sock.sendAll(encodeRequest(requestId, method, params) + "\n", deadline);

    std::string buffer;
    while (true) {
        auto newline = buffer.find('\n');
        if (newline == std::string::npos) {
            buffer += sock.receiveSome(deadline);
            continue;
        }

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto response = nlohmann::json::parse(line, nullptr, false);
        if (response.is_discarded() || !response.is_object()) {
            throw RpcError("malformed response from " + socketPath);
        }

        // id 为 null 的错误响应 (例如服务端 parse error) 也属于本次请求
        const bool ours = response.contains("id") &&
                          (response["id"] == requestId || (response["id"].is_null() && response.contains("error")));
        if (!ours) {
            Logger::getInstance().debug("VS Code: skipping response with foreign id on " + socketPath);
            continue;
        }

        if (response.contains("error") && !response["error"].is_null()) {
            const auto& err = response["error"];
            int code = err.is_object() ? err.value("code", 0) : 0;
            std::string message = err.is_object() ? err.value("message", std::string("unknown error")) : err.dump();
            throw RpcError("RPC error " + std::to_string(code) + ": " + message);
        }
        if (!response.contains("result")) {
            throw RpcError("RPC response missing result");
        }
        return response["result"];
    }
}

BufferStatus VSCodeAction::bufferStatus(const std::string& canonicalPath) const {
    try {
        auto result = call("buffer_status", {{"file_path", canonicalPath}});
        BufferStatus status;
        status.isCurrent = result.at("is_current").get<bool>();
        status.hasUnsavedChanges = result.at("has_unsaved_changes").get<bool>();
        return status;
    } catch (const std::exception& e) {
        Logger::getInstance().debug("VS Code buffer_status failed on " + socketPath + ": " + e.what());
        return BufferStatus{};
    }
}

bool VSCodeAction::refreshBuffer(const std::string& canonicalPath) const {
    try {
        auto result = call("refresh_buffer", {{"file_path", canonicalPath}});
        return result.value("success", false);
    } catch (const std::exception& e) {
        Logger::getInstance().debug("VS Code refresh_buffer failed on " + socketPath + ": " + e.what());
        return false;
    }
}

bool VSCodeAction::sendMessage(const std::string& message) const {
    try {
        auto result = call("send_message", {{"message", message}});
        return result.value("success", false);
    } catch (const std::exception& e) {
        Logger::getInstance().debug("VS Code send_message failed on " + socketPath + ": " + e.what());
        return false;
    }
}

std::optional<SelectionContext> VSCodeAction::getVisualSelection() const {
    try {
        auto result = call("get_visual_selection", nullptr);
        if (result.is_null()) {
            return std::nullopt;
        }
        SelectionContext ctx;
        ctx.filePath = result.at("file_path").get<std::string>();
        ctx.startLine = result.at("start_line").get<int>();
        ctx.endLine = result.at("end_line").get<int>();
        ctx.content = result.at("content").get<std::string>();
        if (ctx.content.empty()) {
            return std::nullopt;
        }
        return ctx;
    } catch (const std::exception& e) {
        Logger::getInstance().debug("VS Code get_visual_selection failed on " + socketPath + ": " + e.what());
        return std::nullopt;
    }
}
