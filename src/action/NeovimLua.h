#pragma once
#include <string>

/**
 * @brief 在 Neovim 端通过 nvim_exec_lua 执行的脚本
 *
 * 每个操作只发一次 RPC，查找与修改都在服务端完成，避免多次往返，也不会改动光标状态。
 * 用户数据 (路径、消息) 一律通过 ... 参数传入，不拼接进脚本。
 */
namespace NeovimLua {
    // 参数: canonicalPath。返回 { is_current, has_unsaved_changes }
    const std::string& bufferStatusScript();

    // 参数: canonicalPath。返回 true / false (文件未打开也返回 true)
    const std::string& refreshBufferScript();

    // 参数: message。以 WARN 级别通知
    const std::string& notifyScript();

    // 无参数。返回 nil 或 { file_path, start_line, end_line, content }
    const std::string& visualSelectionScript();
}
