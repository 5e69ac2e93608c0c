#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "action/ActionTypes.h"
#include "core/Constants.h"

/**
 * @brief VS Code 扩展宿主适配器
 *
 * 协议: Unix socket 上的换行分隔 JSON。
 *
 * 请求:
 * { "id": 1, "method": "buffer_status", "params": { "file_path": "/path/to/file" } }
 *
 * 响应:
 * { "id": 1, "result": { "is_current": true, "has_unsaved_changes": false } }
 * { "id": 1, "error": { "code": -32602, "message": "Missing file_path parameter" } }
 *
 * 每次调用独占一个连接 (connect -> request -> response -> close)，总时长不超过 timeout。
 * 公开接口从不抛异常，失败时返回中性默认值。
 */
class VSCodeAction {
public:
    explicit VSCodeAction(std::string socketPath, std::chrono::milliseconds timeout = kRpcTimeout);

    BufferStatus bufferStatus(const std::string& canonicalPath) const;
    bool refreshBuffer(const std::string& canonicalPath) const;
    bool sendMessage(const std::string& message) const;
    std::optional<SelectionContext> getVisualSelection() const;

    /**
     * @brief 构造一行请求 (不含结尾换行)，params 为 null 时省略该字段
     */
    static std::string encodeRequest(int id, const std::string& method, const nlohmann::json& params);

private:
    std::string socketPath;
    std::chrono::milliseconds timeout;

    // @throws RpcError 及 nlohmann::json::exception
    nlohmann::json call(const std::string& method, const nlohmann::json& params) const;
};
