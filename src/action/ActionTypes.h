#pragma once
#include <string>
#include <optional>

/**
 * @brief 编辑器后端类型
 *
 * 由 socket 文件名中的标记决定 (见 InstanceDiscovery)。
 */
enum class EditorKind {
    Neovim,
    VSCode
};

inline std::string editorKindName(EditorKind kind) {
    switch (kind) {
        case EditorKind::Neovim: return "Neovim";
        case EditorKind::VSCode: return "VS Code";
    }
    return "editor";
}

/**
 * @brief 一个正在运行的编辑器实例
 *
 * 每次 hook 调用重新发现，不做持久化。socketPath 是唯一标识。
 */
struct EditorInstance {
    EditorKind kind = EditorKind::Neovim;
    std::string socketPath;
    std::optional<int> pid;

    bool operator==(const EditorInstance& other) const { return socketPath == other.socketPath; }
    bool operator!=(const EditorInstance& other) const { return !(*this == other); }
    bool operator<(const EditorInstance& other) const { return socketPath < other.socketPath; }
};

/**
 * @brief 某个实例中某个文件 (规范路径) 的缓冲区状态
 *
 * 文件未打开时为 {false, false}，这也是任何失败的中性默认值。
 */
struct BufferStatus {
    bool isCurrent = false;
    bool hasUnsavedChanges = false;

    // 只有“当前缓冲区 + 未保存”才阻止修改
    bool blocksModification() const { return isCurrent && hasUnsavedChanges; }

    bool operator==(const BufferStatus& other) const {
        return isCurrent == other.isCurrent && hasUnsavedChanges == other.hasUnsavedChanges;
    }
};

/**
 * @brief 可视选区上下文，行号从 1 开始
 */
struct SelectionContext {
    std::string filePath;
    int startLine = 0;
    int endLine = 0;
    std::string content;

    bool operator==(const SelectionContext& other) const {
        return filePath == other.filePath && startLine == other.startLine &&
               endLine == other.endLine && content == other.content;
    }
};
