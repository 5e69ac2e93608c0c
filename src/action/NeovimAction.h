#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "action/ActionTypes.h"
#include "core/Constants.h"

/**
 * @brief Neovim 适配器 (msgpack-RPC over Unix socket)
 *
 * 每个操作只发一个 nvim_exec_lua 请求:
 *   请求 [0, msgid, "nvim_exec_lua", [code, args]]
 *   响应 [1, msgid, error, result]
 *
 * 编解码使用 nlohmann::json 的 MessagePack 支持。
 * 公开接口从不抛异常，失败时返回中性默认值。
 */
class NeovimAction {
public:
    explicit NeovimAction(std::string socketPath, std::chrono::milliseconds timeout = kRpcTimeout);

    BufferStatus bufferStatus(const std::string& canonicalPath) const;
    bool refreshBuffer(const std::string& canonicalPath) const;
    bool sendMessage(const std::string& message) const;
    std::optional<SelectionContext> getVisualSelection() const;

    static std::vector<std::uint8_t> encodeRequest(std::uint32_t msgId, const std::string& method,
                                                   const nlohmann::json& params);

private:
    std::string socketPath;
    std::chrono::milliseconds timeout;

    // @throws RpcError 及 nlohmann::json::exception
    nlohmann::json execLua(const std::string& code, const nlohmann::json& args) const;
};
