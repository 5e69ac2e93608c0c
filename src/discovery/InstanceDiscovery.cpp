#include "discovery/InstanceDiscovery.h"
#include "core/Constants.h"
#include "utils/Logger.h"
#include <blake3.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
bool isAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::optional<int> parsePid(const std::string& s) {
    if (!isAllDigits(s) || s.size() > 9) return std::nullopt;
    return std::stoi(s);
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

InstanceDiscovery::InstanceDiscovery(std::string socketDir, std::string workDir)
    : socketDir(std::move(socketDir)), workDir(std::move(workDir)) {}

std::string InstanceDiscovery::hashDirectory(const std::string& canonicalDir) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, canonicalDir.data(), canonicalDir.size());
    uint8_t output[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, output, BLAKE3_OUT_LEN);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BLAKE3_OUT_LEN; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(output[i]);
    }
    return oss.str();
}

std::optional<std::string> InstanceDiscovery::canonicalWorkDir() const {
    std::error_code ec;
    fs::path dir = workDir.empty() ? fs::current_path(ec) : fs::u8path(workDir);
    if (ec) return std::nullopt;
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) return std::nullopt;
    return canonical.u8string();
}

std::optional<EditorInstance> InstanceDiscovery::classify(const fs::path& socketPath, const std::string& dirHash) {
    const std::string name = socketPath.filename().u8string();
    const std::string prefix = dirHash + "-";
    const std::string suffix = ".sock";
    if (name.size() <= prefix.size() + suffix.size() || name.compare(0, prefix.size(), prefix) != 0 ||
        !endsWith(name, suffix)) {
        return std::nullopt;
    }

    // 去掉前缀与后缀，剩下的是 "<pid>" 或 "<marker>-<pid>"
    std::string middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());

    EditorInstance instance;
    instance.socketPath = socketPath.u8string();

    auto dash = middle.find('-');
    if (dash == std::string::npos) {
        instance.kind = EditorKind::Neovim;
        instance.pid = parsePid(middle);
        return instance;
    }

    std::string marker = middle.substr(0, dash);
    if (marker == kVSCodeSocketMarker) {
        instance.kind = EditorKind::VSCode;
        instance.pid = parsePid(middle.substr(dash + 1));
        return instance;
    }
    return std::nullopt;
}

std::vector<EditorInstance> InstanceDiscovery::discover() const {
    std::vector<EditorInstance> instances;

    auto cwd = canonicalWorkDir();
    if (!cwd) {
        Logger::getInstance().debug("Discovery: cannot resolve working directory, no instances");
        return instances;
    }
    const std::string dirHash = hashDirectory(*cwd);

    std::error_code ec;
    fs::directory_iterator it(fs::u8path(socketDir), fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::getInstance().debug("Discovery: cannot list " + socketDir + ": " + ec.message());
        return instances;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Logger::getInstance().debug("Discovery: listing " + socketDir + " stopped: " + ec.message());
            break;
        }
        const fs::path& entry = it->path();
        std::error_code typeEc;
        if (it->is_directory(typeEc)) continue;

        auto instance = classify(entry, dirHash);
        if (instance) {
            instances.push_back(std::move(*instance));
        } else if (entry.filename().u8string().compare(0, dirHash.size() + 1, dirHash + "-") == 0) {
            Logger::getInstance().debug("Discovery: skipping socket with unknown marker: " + entry.u8string());
        }
    }

    std::sort(instances.begin(), instances.end());
    Logger::getInstance().debug("Discovery: found " + std::to_string(instances.size()) + " instance(s) for " + *cwd);
    return instances;
}

std::string InstanceDiscovery::socketPathFor(EditorKind kind, int pid) const {
    auto cwd = canonicalWorkDir();
    if (!cwd) {
        throw std::runtime_error("Failed to canonicalize working directory");
    }
    std::string name = hashDirectory(*cwd) + "-";
    if (kind == EditorKind::VSCode) {
        name += std::string(kVSCodeSocketMarker) + "-";
    }
    name += std::to_string(pid) + ".sock";
    return (fs::u8path(socketDir) / name).u8string();
}
