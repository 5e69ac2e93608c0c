#include "action/InstanceFanOut.h"
#include "action/EditorAction.h"
#include "utils/Logger.h"
#include <algorithm>
#include <system_error>
#include <thread>

namespace {
template <typename Result>
std::optional<Result> awaitResult(std::future<Result>& future, std::chrono::steady_clock::time_point deadline,
                                  const EditorInstance& instance) {
    if (!future.valid()) {
        return std::nullopt;
    }
    if (future.wait_until(deadline) != std::future_status::ready) {
        Logger::getInstance().debug("Fan-out: " + instance.socketPath + " did not finish before the deadline");
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        Logger::getInstance().debug("Fan-out: worker for " + instance.socketPath + " failed: " + e.what());
        return std::nullopt;
    }
}
} // namespace

size_t BroadcastHandle::waitFor(std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    size_t succeeded = 0;
    for (auto& result : results) {
        if (!result.valid()) continue;
        if (result.wait_until(deadline) != std::future_status::ready) continue;
        try {
            if (result.get()) {
                ++succeeded;
            }
        } catch (const std::exception& e) {
            Logger::getInstance().debug(std::string("Fan-out: broadcast worker failed: ") + e.what());
        }
    }
    return succeeded;
}

InstanceFanOut::InstanceFanOut(std::vector<EditorInstance> instances, std::chrono::milliseconds timeout)
    : instances(std::move(instances)), timeout(timeout) {
    // 固定的确定性顺序: socket 路径字典序
    std::sort(this->instances.begin(), this->instances.end());
    this->instances.erase(std::unique(this->instances.begin(), this->instances.end()), this->instances.end());
}

std::chrono::steady_clock::time_point InstanceFanOut::joinDeadline() const {
    return std::chrono::steady_clock::now() + timeout + kJoinGrace;
}

template <typename Result, typename Fn>
std::vector<std::future<Result>> InstanceFanOut::dispatch(Fn fn) const {
    std::vector<std::future<Result>> futures;
    futures.reserve(instances.size());

    for (const auto& instance : instances) {
        std::promise<Result> promise;
        futures.push_back(promise.get_future());

        // worker 分离运行，只持有自己的 promise 与 action 副本，不共享可变状态。
        // 超时的 worker 被调用方放弃，其自身 I/O 也受同一时限约束，随后自行结束。
        try {
            std::thread([promise = std::move(promise), action = EditorAction(instance, timeout), fn]() mutable {
                try {
                    promise.set_value(fn(action));
                } catch (...) {
                    promise.set_exception(std::current_exception());
                }
            }).detach();
        } catch (const std::system_error& e) {
            // 线程创建失败时 promise 随 lambda 析构，future 得到 broken_promise
            Logger::getInstance().warn("Fan-out: cannot start worker for " + instance.socketPath + ": " + e.what());
        }
    }
    return futures;
}

AggregatedDecision InstanceFanOut::reduceBufferStatus(const std::vector<EditorInstance>& instances,
                                                      const std::vector<std::optional<BufferStatus>>& statuses) {
    AggregatedDecision decision;
    const size_t n = std::min(instances.size(), statuses.size());
    for (size_t i = 0; i < n; ++i) {
        if (!statuses[i]) continue;
        ++decision.completed;
        if (statuses[i]->blocksModification() && !decision.blocked) {
            decision.blocked = true;
            decision.blockingKind = instances[i].kind;
            decision.blockingEndpoint = instances[i].socketPath;
        }
    }
    return decision;
}

std::optional<SelectionContext> InstanceFanOut::firstSelection(
    const std::vector<std::optional<SelectionContext>>& selections) {
    for (const auto& selection : selections) {
        if (selection && !selection->content.empty()) {
            return selection;
        }
    }
    return std::nullopt;
}

AggregatedDecision InstanceFanOut::bufferStatus(const std::string& canonicalPath) const {
    if (instances.empty()) {
        return AggregatedDecision{};
    }

    const auto deadline = joinDeadline();
    auto futures = dispatch<BufferStatus>([canonicalPath](const EditorAction& action) {
        return action.bufferStatus(canonicalPath);
    });

    std::vector<std::optional<BufferStatus>> statuses;
    statuses.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        statuses.push_back(awaitResult(futures[i], deadline, instances[i]));
    }

    auto decision = reduceBufferStatus(instances, statuses);
    Logger::getInstance().debug("Fan-out: buffer_status for " + canonicalPath + " -> " +
                                (decision.blocked ? "blocked" : "clear") + " (" +
                                std::to_string(decision.completed) + "/" + std::to_string(instances.size()) +
                                " completed)");
    return decision;
}

BroadcastHandle InstanceFanOut::refreshBuffer(const std::string& canonicalPath) const {
    return BroadcastHandle(dispatch<bool>([canonicalPath](const EditorAction& action) {
        return action.refreshBuffer(canonicalPath);
    }));
}

BroadcastHandle InstanceFanOut::sendMessage(const std::string& message) const {
    return BroadcastHandle(dispatch<bool>([message](const EditorAction& action) {
        return action.sendMessage(message);
    }));
}

std::optional<SelectionContext> InstanceFanOut::getVisualSelection() const {
    if (instances.empty()) {
        return std::nullopt;
    }

    const auto deadline = joinDeadline();
    auto futures = dispatch<std::optional<SelectionContext>>([](const EditorAction& action) {
        return action.getVisualSelection();
    });

    // 按固定顺序逐个等待: 第 i 个有结果时，前面的实例都已确定为空
    std::optional<SelectionContext> chosen;
    for (size_t i = 0; i < futures.size(); ++i) {
        auto selection = awaitResult(futures[i], deadline, instances[i]);
        if (!chosen && selection && *selection && !(*selection)->content.empty()) {
            chosen = *selection;
        }
    }
    return chosen;
}
