#pragma once
#include <string>

/**
 * @brief 规范化文件路径 (解析符号链接)
 *
 * 规范路径是把 hook 目标文件与编辑器缓冲区对应起来的唯一依据。
 * 相对路径先相对 baseDir (为空则相对进程当前目录) 解析。
 * 文件不存在等无法 realpath 的情况退化为词法规范化后的绝对路径，不抛异常。
 */
std::string canonicalizePath(const std::string& path, const std::string& baseDir = "");
