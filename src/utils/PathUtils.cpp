#include "utils/PathUtils.h"
#include <filesystem>

namespace fs = std::filesystem;

std::string canonicalizePath(const std::string& path, const std::string& baseDir) {
    if (path.empty()) {
        return path;
    }

    std::error_code ec;
    fs::path p = fs::u8path(path);
    if (p.is_relative()) {
        fs::path base = baseDir.empty() ? fs::current_path(ec) : fs::u8path(baseDir);
        if (ec) {
            return path;
        }
        p = base / p;
    }

    fs::path resolved = fs::canonical(p, ec);
    if (!ec) {
        return resolved.u8string();
    }

    // 文件尚不存在 (例如 Write 新建文件): 尽量解析已存在的父目录部分
    resolved = fs::weakly_canonical(p, ec);
    if (!ec) {
        return resolved.u8string();
    }
    return p.lexically_normal().u8string();
}
