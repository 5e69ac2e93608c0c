/**
 * 测试用的编辑器替身：在真实的 Unix socket 上监听，按协议解析一条请求并回复。
 *
 * - JsonLines:  VS Code 扩展宿主 (换行分隔 JSON)
 * - MsgpackRpc: Neovim (msgpack-RPC，nvim_exec_lua)
 *
 * 每个连接只处理一条请求，处理完即关闭。可设置回复前延迟、直接断开或回复垃圾数据。
 */
#pragma once
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "action/ActionTypes.h"
#include "action/NeovimLua.h"

class FakeEditorServer {
public:
    enum class Protocol { JsonLines, MsgpackRpc };

    // 返回要写回的原始字节；返回空串表示不回复直接断开
    using Handler = std::function<std::string(const nlohmann::json& request)>;

    FakeEditorServer(std::string path, Protocol protocol, Handler handler)
        : path(std::move(path)), protocol(protocol), handler(std::move(handler)) {
        listenFd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listenFd < 0) {
            throw std::runtime_error("socket() failed");
        }
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (this->path.size() >= sizeof(addr.sun_path)) {
            ::close(listenFd);
            throw std::runtime_error("socket path too long: " + this->path);
        }
        std::memcpy(addr.sun_path, this->path.c_str(), this->path.size() + 1);
        ::unlink(this->path.c_str());
        if (::bind(listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listenFd, 16) != 0) {
            ::close(listenFd);
            throw std::runtime_error("bind/listen failed on " + this->path + ": " + std::strerror(errno));
        }
        worker = std::thread([this]() { acceptLoop(); });
    }

    ~FakeEditorServer() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv.notify_all();
        if (worker.joinable()) worker.join();
        ::close(listenFd);
        ::unlink(path.c_str());
    }

    FakeEditorServer(const FakeEditorServer&) = delete;
    FakeEditorServer& operator=(const FakeEditorServer&) = delete;

    void setDelay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mtx);
        delay = d;
    }

    std::vector<nlohmann::json> requests() {
        std::lock_guard<std::mutex> lock(mtx);
        return received;
    }

    size_t requestCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return received.size();
    }

    const std::string& getPath() const { return path; }

    // ---- JsonLines 回复 ----
    static std::string jsonResult(const nlohmann::json& request, const nlohmann::json& result) {
        return nlohmann::json{{"id", request.value("id", 0)}, {"result", result}}.dump() + "\n";
    }

    static std::string jsonError(const nlohmann::json& request, int code, const std::string& message) {
        nlohmann::json error = {{"code", code}, {"message", message}};
        return nlohmann::json{{"id", request.value("id", 0)}, {"error", error}}.dump() + "\n";
    }

    // ---- msgpack-RPC 回复 ----
    static std::string rpcResult(const nlohmann::json& request, const nlohmann::json& result) {
        return pack(nlohmann::json::array({1, request[1], nullptr, result}));
    }

    static std::string rpcError(const nlohmann::json& request, const std::string& message) {
        return pack(nlohmann::json::array({1, request[1], nlohmann::json::array({0, message}), nullptr}));
    }

    static std::string rpcNotification(const std::string& method) {
        return pack(nlohmann::json::array({2, method, nlohmann::json::array()}));
    }

    static std::string pack(const nlohmann::json& message) {
        auto bytes = nlohmann::json::to_msgpack(message);
        return std::string(bytes.begin(), bytes.end());
    }

    /**
     * @brief 把 nvim_exec_lua 请求还原为与 VS Code 一致的方法名
     */
    static std::string neovimMethod(const nlohmann::json& request) {
        const std::string code = request[3][0].get<std::string>();
        if (code == NeovimLua::bufferStatusScript()) return "buffer_status";
        if (code == NeovimLua::refreshBufferScript()) return "refresh_buffer";
        if (code == NeovimLua::notifyScript()) return "send_message";
        if (code == NeovimLua::visualSelectionScript()) return "get_visual_selection";
        return "unknown";
    }

private:
    std::string path;
    Protocol protocol;
    Handler handler;
    int listenFd = -1;
    std::thread worker;

    std::mutex mtx;
    std::condition_variable cv;
    bool stopping = false;
    std::chrono::milliseconds delay{0};
    std::vector<nlohmann::json> received;

    bool isStopping() {
        std::lock_guard<std::mutex> lock(mtx);
        return stopping;
    }

    void acceptLoop() {
        while (!isStopping()) {
            pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 20) <= 0) continue;

            int conn = ::accept4(listenFd, nullptr, nullptr, SOCK_CLOEXEC);
            if (conn < 0) continue;
            serve(conn);
            ::close(conn);
        }
    }

    std::optional<nlohmann::json> readRequest(int conn) {
        timeval tv{};
        tv.tv_sec = 2;
        ::setsockopt(conn, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::vector<std::uint8_t> buffer;
        char chunk[4096];
        while (true) {
            ssize_t n = ::recv(conn, chunk, sizeof(chunk), 0);
            if (n <= 0) return std::nullopt;
            buffer.insert(buffer.end(), chunk, chunk + n);

            if (protocol == Protocol::JsonLines) {
                auto newline = std::find(buffer.begin(), buffer.end(), '\n');
                if (newline == buffer.end()) continue;
                auto request = nlohmann::json::parse(buffer.begin(), newline, nullptr, false);
                if (request.is_discarded()) return std::nullopt;
                return request;
            }
            auto request = nlohmann::json::from_msgpack(buffer, false, false);
            if (!request.is_discarded()) return request;
        }
    }

    void serve(int conn) {
        auto request = readRequest(conn);
        if (!request) return;

        std::chrono::milliseconds wait;
        {
            std::unique_lock<std::mutex> lock(mtx);
            received.push_back(*request);
            wait = delay;
            if (wait.count() > 0) {
                // 析构时立即唤醒，避免拖慢测试收尾
                cv.wait_for(lock, wait, [this]() { return stopping; });
                if (stopping) return;
            }
        }

        std::string reply = handler(*request);
        if (reply.empty()) return;

        size_t sent = 0;
        while (sent < reply.size()) {
            ssize_t n = ::send(conn, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }
};

/**
 * @brief 编辑器状态替身：按规范路径给出缓冲区状态，可选地带一个可视选区
 */
struct FakeEditorState {
    std::map<std::string, BufferStatus> buffers;
    std::optional<SelectionContext> selection;
};

inline FakeEditorServer::Protocol protocolFor(EditorKind kind) {
    return kind == EditorKind::Neovim ? FakeEditorServer::Protocol::MsgpackRpc
                                      : FakeEditorServer::Protocol::JsonLines;
}

/**
 * @brief 按 FakeEditorState 回答四个操作的处理函数，两种协议通用
 */
inline FakeEditorServer::Handler fakeEditorHandler(EditorKind kind, FakeEditorState state) {
    return [kind, state](const nlohmann::json& request) -> std::string {
        const bool neovim = kind == EditorKind::Neovim;
        const std::string method = neovim ? FakeEditorServer::neovimMethod(request)
                                          : request.value("method", std::string());
        const nlohmann::json args = neovim ? request[3][1] : request.value("params", nlohmann::json::object());

        nlohmann::json result;
        if (method == "buffer_status") {
            const std::string file = neovim ? args[0].get<std::string>() : args.at("file_path").get<std::string>();
            BufferStatus status;
            auto it = state.buffers.find(file);
            if (it != state.buffers.end()) status = it->second;
            result = {{"is_current", status.isCurrent}, {"has_unsaved_changes", status.hasUnsavedChanges}};
        } else if (method == "refresh_buffer" || method == "send_message") {
            result = neovim ? nlohmann::json(true) : nlohmann::json{{"success", true}};
        } else if (method == "get_visual_selection") {
            if (state.selection) {
                result = {{"file_path", state.selection->filePath},
                          {"start_line", state.selection->startLine},
                          {"end_line", state.selection->endLine},
                          {"content", state.selection->content}};
            }
        } else {
            return neovim ? FakeEditorServer::rpcError(request, "unknown script")
                          : FakeEditorServer::jsonError(request, -32601, "Method not found");
        }
        return neovim ? FakeEditorServer::rpcResult(request, result) : FakeEditorServer::jsonResult(request, result);
    };
}

/**
 * @brief /tmp 下的短名临时目录 (socket 路径长度受 sun_path 限制)
 */
class ShortTempDir {
public:
    ShortTempDir() {
        char templ[] = "/tmp/skXXXXXX";
        char* created = ::mkdtemp(templ);
        if (!created) {
            throw std::runtime_error("mkdtemp failed");
        }
        dir = created;
    }

    ~ShortTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    ShortTempDir(const ShortTempDir&) = delete;
    ShortTempDir& operator=(const ShortTempDir&) = delete;

    const std::string& path() const { return dir; }

private:
    std::string dir;
};
