#include <iostream>
#include <string>
#include <vector>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include "core/ConfigManager.h"
#include "discovery/InstanceDiscovery.h"
#include "handler/HookHandler.h"
#include "utils/Logger.h"

void printUsage() {
    std::cerr << "Usage: sidekick hook" << std::endl;
    std::cerr << "       sidekick neovim [nvim args...]" << std::endl;
}

// 读取 stdin 上的 hook payload，决定写到 stdout
int runHook(const Config& cfg) {
    HookHandler handler(HookHandlerOptions::fromConfig(cfg));
    try {
        handler.run(std::cin, std::cout);
    } catch (const HookParseError& e) {
        Logger::getInstance().error(std::string("Failed to decode hook payload: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Hook failed: ") + e.what());
        return 1;
    }
    return 0;
}

// 用基于当前目录与自身 pid 的 socket 启动 Neovim (exec 后 pid 不变)
int runNeovim(const Config& cfg, const std::vector<std::string>& args) {
    std::string socketPath;
    try {
        InstanceDiscovery discovery(cfg.discovery.socketDir);
        socketPath = discovery.socketPathFor(EditorKind::Neovim, static_cast<int>(getpid()));
    } catch (const std::exception& e) {
        Logger::getInstance().error(e.what());
        return 1;
    }

    std::vector<std::string> argvStrings = {"nvim", "--listen", socketPath};
    argvStrings.insert(argvStrings.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argvStrings.size() + 1);
    for (auto& arg : argvStrings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());

    // exec 返回即失败
    Logger::getInstance().error(std::string("Failed to execute nvim: ") + std::strerror(errno));
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    Config cfg = Config::loadDefault();
    Logger::getInstance().setLogFile(cfg.log.file);
    Logger::getInstance().setDebugEnabled(cfg.log.enableDebug);

    std::string command = argv[1];
    if (command == "hook") {
        return runHook(cfg);
    }
    if (command == "neovim") {
        return runNeovim(cfg, std::vector<std::string>(argv + 2, argv + argc));
    }

    printUsage();
    return 1;
}
