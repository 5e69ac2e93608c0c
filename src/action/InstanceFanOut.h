#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <future>
#include <optional>
#include "action/ActionTypes.h"
#include "core/Constants.h"

/**
 * @brief buffer_status 的聚合结果
 *
 * blocked = OR(is_current && has_unsaved_changes)，只统计在时限内应答的实例。
 * 多个实例同时阻止时，blockingKind / blockingEndpoint 取 socket 路径序中的第一个。
 */
struct AggregatedDecision {
    bool blocked = false;
    std::optional<EditorKind> blockingKind;
    std::optional<std::string> blockingEndpoint;
    // 在汇合时限内完成的 worker 数
    size_t completed = 0;
};

/**
 * @brief 广播型副作用 (refresh / notify) 的句柄
 *
 * 析构不会阻塞；需要时由调用方决定等待多久。
 */
class BroadcastHandle {
public:
    BroadcastHandle() = default;
    explicit BroadcastHandle(std::vector<std::future<bool>> results) : results(std::move(results)) {}

    /**
     * @brief 最多等待 budget，返回已成功完成的实例数
     */
    size_t waitFor(std::chrono::milliseconds budget);

    size_t size() const { return results.size(); }

private:
    std::vector<std::future<bool>> results;
};

/**
 * @brief 多实例并发分发与结果归约
 *
 * 每个实例每次操作一个独立 worker，各自受单实例时限约束；慢实例只会被排除，
 * 不会拖慢或污染其他实例的结果。这是整个系统唯一的并发边界。
 *
 * 归约策略:
 * - bufferStatus: 有界汇合 (所有 worker 完成或超时) 后做 OR
 * - refreshBuffer / sendMessage: 广播后立即返回
 * - getVisualSelection: 按 socket 路径序取第一个非空结果，与应答先后无关；
 *   返回前同样有界汇合剩余的 worker，不留仍在运行的查询
 */
class InstanceFanOut {
public:
    InstanceFanOut(std::vector<EditorInstance> instances, std::chrono::milliseconds timeout = kRpcTimeout);

    AggregatedDecision bufferStatus(const std::string& canonicalPath) const;
    BroadcastHandle refreshBuffer(const std::string& canonicalPath) const;
    BroadcastHandle sendMessage(const std::string& message) const;
    std::optional<SelectionContext> getVisualSelection() const;

    // 已排序的实例列表
    const std::vector<EditorInstance>& getInstances() const { return instances; }

    /**
     * @brief 归约 buffer_status 结果；statuses[i] 对应 instances[i]，nullopt 表示未应答
     */
    static AggregatedDecision reduceBufferStatus(const std::vector<EditorInstance>& instances,
                                                 const std::vector<std::optional<BufferStatus>>& statuses);

    /**
     * @brief 按给定顺序取第一个非空选区
     */
    static std::optional<SelectionContext> firstSelection(const std::vector<std::optional<SelectionContext>>& selections);

private:
    std::vector<EditorInstance> instances;
    std::chrono::milliseconds timeout;

    template <typename Result, typename Fn>
    std::vector<std::future<Result>> dispatch(Fn fn) const;

    std::chrono::steady_clock::time_point joinDeadline() const;
};
