#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "discovery/InstanceDiscovery.h"
#include "FakeEditorServer.h"

namespace fs = std::filesystem;

class InstanceDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        workDir = fs::canonical(work.path()).u8string();
        dirHash = InstanceDiscovery::hashDirectory(workDir);
    }

    void touch(const std::string& name) {
        std::ofstream f(fs::path(sockets.path()) / name);
        f << "";
    }

    ShortTempDir sockets;
    ShortTempDir work;
    std::string workDir;
    std::string dirHash;
};

TEST(InstanceDiscoveryHash, IsLowercaseHexAndDeterministic) {
    auto h1 = InstanceDiscovery::hashDirectory("/home/user/project");
    auto h2 = InstanceDiscovery::hashDirectory("/home/user/project");
    auto other = InstanceDiscovery::hashDirectory("/home/user/other");

    EXPECT_EQ(h1.size(), 64u);
    EXPECT_EQ(h1, h2);
    EXPECT_NE(h1, other);
    EXPECT_EQ(h1.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(InstanceDiscoveryHash, MatchesBlake3OfEmptyInput) {
    EXPECT_EQ(InstanceDiscovery::hashDirectory(""),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(InstanceDiscoveryClassify, RecognizesBothBackends) {
    const std::string hash(64, 'a');

    auto neovim = InstanceDiscovery::classify("/tmp/" + hash + "-4242.sock", hash);
    ASSERT_TRUE(neovim.has_value());
    EXPECT_EQ(neovim->kind, EditorKind::Neovim);
    EXPECT_EQ(neovim->pid, std::optional<int>(4242));
    EXPECT_EQ(neovim->socketPath, "/tmp/" + hash + "-4242.sock");

    auto vscode = InstanceDiscovery::classify("/tmp/" + hash + "-vscode-77.sock", hash);
    ASSERT_TRUE(vscode.has_value());
    EXPECT_EQ(vscode->kind, EditorKind::VSCode);
    EXPECT_EQ(vscode->pid, std::optional<int>(77));
}

TEST(InstanceDiscoveryClassify, RejectsForeignOrUnknownNames) {
    const std::string hash(64, 'a');
    const std::string otherHash(64, 'b');

    EXPECT_FALSE(InstanceDiscovery::classify("/tmp/" + otherHash + "-1.sock", hash).has_value());
    EXPECT_FALSE(InstanceDiscovery::classify("/tmp/" + hash + "-emacs-1.sock", hash).has_value());
    EXPECT_FALSE(InstanceDiscovery::classify("/tmp/" + hash + "-1.socket", hash).has_value());
    EXPECT_FALSE(InstanceDiscovery::classify("/tmp/" + hash + "-.sock", hash).has_value());
}

TEST(InstanceDiscoveryClassify, PidIsBestEffort) {
    const std::string hash(64, 'c');
    auto instance = InstanceDiscovery::classify("/tmp/" + hash + "-abc.sock", hash);
    ASSERT_TRUE(instance.has_value());
    EXPECT_EQ(instance->kind, EditorKind::Neovim);
    EXPECT_FALSE(instance->pid.has_value());
}

TEST_F(InstanceDiscoveryTest, DiscoversInstancesForWorkingDirectoryOnly) {
    touch(dirHash + "-200.sock");
    touch(dirHash + "-vscode-100.sock");
    touch(dirHash + "-emacs-300.sock");
    touch(std::string(64, '0') + "-400.sock");
    touch("unrelated.txt");

    InstanceDiscovery discovery(sockets.path(), workDir);
    auto instances = discovery.discover();

    ASSERT_EQ(instances.size(), 2u);
    EXPECT_TRUE(std::is_sorted(instances.begin(), instances.end()));

    size_t neovim = 0, vscode = 0;
    for (const auto& instance : instances) {
        EXPECT_EQ(fs::path(instance.socketPath).parent_path(), fs::path(sockets.path()));
        if (instance.kind == EditorKind::Neovim) {
            ++neovim;
            EXPECT_EQ(instance.pid, std::optional<int>(200));
        } else {
            ++vscode;
            EXPECT_EQ(instance.pid, std::optional<int>(100));
        }
    }
    EXPECT_EQ(neovim, 1u);
    EXPECT_EQ(vscode, 1u);
}

TEST_F(InstanceDiscoveryTest, MissingSocketDirectoryYieldsNoInstances) {
    InstanceDiscovery discovery(sockets.path() + "/does-not-exist", workDir);
    EXPECT_TRUE(discovery.discover().empty());
}

TEST_F(InstanceDiscoveryTest, MissingWorkDirectoryYieldsNoInstances) {
    touch(dirHash + "-1.sock");
    InstanceDiscovery discovery(sockets.path(), workDir + "/gone");
    EXPECT_TRUE(discovery.discover().empty());
}

TEST_F(InstanceDiscoveryTest, SocketPathForRoundTripsThroughDiscovery) {
    InstanceDiscovery discovery(sockets.path(), workDir);

    auto neovimPath = discovery.socketPathFor(EditorKind::Neovim, 31);
    auto vscodePath = discovery.socketPathFor(EditorKind::VSCode, 32);
    EXPECT_EQ(fs::path(neovimPath).filename().u8string(), dirHash + "-31.sock");
    EXPECT_EQ(fs::path(vscodePath).filename().u8string(), dirHash + "-vscode-32.sock");

    FakeEditorServer nvim(neovimPath, FakeEditorServer::Protocol::MsgpackRpc,
                          fakeEditorHandler(EditorKind::Neovim, {}));
    FakeEditorServer code(vscodePath, FakeEditorServer::Protocol::JsonLines,
                          fakeEditorHandler(EditorKind::VSCode, {}));

    auto instances = discovery.discover();
    ASSERT_EQ(instances.size(), 2u);
    for (const auto& instance : instances) {
        if (instance.kind == EditorKind::Neovim) {
            EXPECT_EQ(instance.socketPath, neovimPath);
        } else {
            EXPECT_EQ(instance.socketPath, vscodePath);
        }
    }
}

TEST_F(InstanceDiscoveryTest, SymlinkedWorkDirectoryHashesToSameScope) {
    fs::path link = fs::path(sockets.path()) / "link";
    fs::create_directory_symlink(workDir, link);

    InstanceDiscovery viaLink(sockets.path(), link.u8string());
    InstanceDiscovery direct(sockets.path(), workDir);
    EXPECT_EQ(viaLink.socketPathFor(EditorKind::Neovim, 9), direct.socketPathFor(EditorKind::Neovim, 9));
}
