#pragma once
#include <string>
#include <chrono>
#include <stdexcept>

/**
 * @brief 单个实例调用中的传输层错误 (拒绝连接、超时、连接断开、协议错误)
 *
 * 只在 action 层内部传播，适配器公开接口在边界处捕获并映射为中性默认值。
 */
class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Unix domain socket 连接 (RAII)
 *
 * 所有阻塞点 (connect / send / recv) 都以调用方给定的 deadline 为界。
 */
class UnixSocket {
public:
    using Clock = std::chrono::steady_clock;

    UnixSocket() = default;
    ~UnixSocket();

    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;
    UnixSocket(UnixSocket&& other) noexcept;
    UnixSocket& operator=(UnixSocket&& other) noexcept;

    /**
     * @throws RpcError 路径过长、连接被拒绝或超时
     */
    static UnixSocket connect(const std::string& path, Clock::time_point deadline);

    void sendAll(const std::string& data, Clock::time_point deadline);

    /**
     * @brief 读取一段可用数据 (至少 1 字节)
     * @throws RpcError 超时或对端关闭
     */
    std::string receiveSome(Clock::time_point deadline);

    bool isValid() const { return fd >= 0; }
    void close();

private:
    explicit UnixSocket(int fd) : fd(fd) {}

    void waitFor(short events, Clock::time_point deadline, const char* what);

    int fd = -1;
};
