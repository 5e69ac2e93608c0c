#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "action/ActionTypes.h"

/**
 * @brief 编辑器实例发现
 *
 * socket 命名规则 (socketDir 默认为 /tmp):
 * - Neovim:  <blake3(cwd)>-<pid>.sock
 * - VS Code: <blake3(cwd)>-vscode-<pid>.sock
 *
 * 其中 cwd 为规范化后的工作目录，hash 为 64 位小写十六进制。
 * 同一目录可以有多个实例 (pid 不同)，不同目录之间不会冲突。
 */
class InstanceDiscovery {
public:
    /**
     * @param socketDir 存放 socket 的共享临时目录
     * @param workDir 工作目录，为空时使用进程当前目录
     */
    InstanceDiscovery(std::string socketDir, std::string workDir = "");

    /**
     * @brief 枚举当前目录下所有候选实例
     *
     * 文件系统错误 (目录不存在、无权限等) 一律退化为空列表，不抛异常。
     * 返回结果按 socket 路径排序。
     */
    std::vector<EditorInstance> discover() const;

    /**
     * @brief 计算指定类型、指定 pid 的实例应监听的 socket 路径
     * @throws std::runtime_error 工作目录无法规范化时
     */
    std::string socketPathFor(EditorKind kind, int pid) const;

    /**
     * @brief 对规范化目录字符串做 blake3，返回十六进制摘要
     */
    static std::string hashDirectory(const std::string& canonicalDir);

    /**
     * @brief 按文件名分类 socket，前缀不匹配或标记未知时返回 nullopt
     */
    static std::optional<EditorInstance> classify(const std::filesystem::path& socketPath,
                                                  const std::string& dirHash);

private:
    std::string socketDir;
    std::string workDir;

    std::optional<std::string> canonicalWorkDir() const;
};
