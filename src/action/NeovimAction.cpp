#include "action/NeovimAction.h"
#include "action/NeovimLua.h"
#include "action/UnixSocket.h"
#include "utils/Logger.h"

namespace {
constexpr int MSG_REQUEST = 0;
constexpr int MSG_RESPONSE = 1;
constexpr int MSG_NOTIFICATION = 2;

// Neovim 的错误对象形如 [type, "message"]
std::string describeError(const nlohmann::json& err) {
    if (err.is_array() && err.size() >= 2 && err[1].is_string()) {
        return err[1].get<std::string>();
    }
    return err.dump();
}

// 缓冲区中第一条完整消息占用的字节数。非严格解析对前缀长度单调：
// 前缀不足时失败，覆盖整条消息后成功，二分即可找到边界
size_t firstMessageLength(const std::vector<std::uint8_t>& buffer) {
    size_t lo = 1;
    size_t hi = buffer.size();
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        auto prefix = nlohmann::json::from_msgpack(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(mid),
                                                   false, false);
        if (prefix.is_discarded()) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return hi;
}
} // namespace

NeovimAction::NeovimAction(std::string socketPath, std::chrono::milliseconds timeout)
    : socketPath(std::move(socketPath)), timeout(timeout) {}

std::vector<std::uint8_t> NeovimAction::encodeRequest(std::uint32_t msgId, const std::string& method,
                                                      const nlohmann::json& params) {
    nlohmann::json request = nlohmann::json::array({MSG_REQUEST, msgId, method, params});
    return nlohmann::json::to_msgpack(request);
}

nlohmann::json NeovimAction::execLua(const std::string& code, const nlohmann::json& args) const {
    const auto deadline = UnixSocket::Clock::now() + timeout;
    const std::uint32_t msgId = 1;

    UnixSocket sock = UnixSocket::connect(socketPath, deadline);
    auto request = encodeRequest(msgId, "nvim_exec_lua", nlohmann::json::array({code, args}));
    sock.sendAll(std::string(request.begin(), request.end()), deadline);

    std::vector<std::uint8_t> buffer;
    while (true) {
        auto chunk = sock.receiveSome(deadline);
        buffer.insert(buffer.end(), chunk.begin(), chunk.end());

        // 非严格模式: 只解析第一条消息；数据不完整时得到 discarded，继续读
        auto message = nlohmann::json::from_msgpack(buffer, false, false);
        while (!message.is_discarded()) {
            if (!message.is_array() || message.empty() || !message[0].is_number_integer()) {
                throw RpcError("malformed msgpack-rpc message from " + socketPath);
            }

            const int type = message[0].get<int>();
            if (type == MSG_NOTIFICATION) {
                // 未订阅任何事件，正常不会出现；按实际占用的字节跳过
                // (对端可能用非最短的整数或 float32 编码，重新编码的长度不可靠)
                auto consumed = firstMessageLength(buffer);
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
                message = nlohmann::json::from_msgpack(buffer, false, false);
                continue;
            }

            if (type != MSG_RESPONSE || message.size() != 4 || message[1] != msgId) {
                throw RpcError("unexpected msgpack-rpc message from " + socketPath);
            }
            if (!message[2].is_null()) {
                throw RpcError("nvim_exec_lua failed: " + describeError(message[2]));
            }
            return message[3];
        }
    }
}

BufferStatus NeovimAction::bufferStatus(const std::string& canonicalPath) const {
    try {
        auto result = execLua(NeovimLua::bufferStatusScript(), nlohmann::json::array({canonicalPath}));
        BufferStatus status;
        status.isCurrent = result.at("is_current").get<bool>();
        status.hasUnsavedChanges = result.at("has_unsaved_changes").get<bool>();
        return status;
    } catch (const std::exception& e) {
        Logger::getInstance().debug("Neovim buffer_status failed on " + socketPath + ": " + e.what());
        return BufferStatus{};
    }
}

bool NeovimAction::refreshBuffer(const std::string& canonicalPath) const {
    try {
        auto result = execLua(NeovimLua::refreshBufferScript(), nlohmann::json::array({canonicalPath}));
        return result.is_boolean() && result.get<bool>();
    } catch (const std::exception& e) {
        Logger::getInstance().debug("Neovim refresh_buffer failed on " + socketPath + ": " + e.what());
        return false;
    }
}

bool NeovimAction::sendMessage(const std::string& message) const {
    try {
        auto result = execLua(NeovimLua::notifyScript(), nlohmann::json::array({message}));
        return result.is_boolean() && result.get<bool>();
    } catch (const std::exception& e) {
        Logger::getInstance().debug("Neovim send_message failed on " + socketPath + ": " + e.what());
        return false;
    }
}

std::optional<SelectionContext> NeovimAction::getVisualSelection() const {
    try {
        auto result = execLua(NeovimLua::visualSelectionScript(), nlohmann::json::array());
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
        Logger::getInstance().debug("Neovim get_visual_selection failed on " + socketPath + ": " + e.what());
        return std::nullopt;
    }
}
