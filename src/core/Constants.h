#pragma once
#include <chrono>

// 单个编辑器实例一次调用 (connect -> request -> response) 的总时限
constexpr std::chrono::milliseconds kRpcTimeout{2000};

// fan-out 汇合时在单实例时限之外额外等待的余量
constexpr std::chrono::milliseconds kJoinGrace{100};

constexpr const char* kDefaultSocketDir = "/tmp";

constexpr const char* kDefaultDenyNotice = "Claude tried to edit this file";

// VS Code 扩展的 socket 文件名标记: <hash>-vscode-<pid>.sock
constexpr const char* kVSCodeSocketMarker = "vscode";
