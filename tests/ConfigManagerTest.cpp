#include <ConfigManager.hpp>
#include <Env.hpp>
#include <gtest/gtest.h>

#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestHelpers.hpp"

// Owns the strings behind a fake argv.
class FakeArgv {
   public:
    FakeArgv(std::initializer_list<std::string> args) : args_(args) {
        for (auto& arg : args_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] CommandLine line() {
        return {static_cast<int>(args_.size()), pointers_.data()};
    }

   private:
    std::vector<std::string> args_;
    std::vector<char*> pointers_;
};

class ConfigManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        Env env;
        if (env["HOME"].has()) {
            home_ = env["HOME"].get();
        }
        // Keep the user's own config file out of the way
        env["HOME"] = dir_.path().string();
        for (const auto& entry : ConfigManager::kConfigMap) {
            env[envName(entry)].clear();
        }
    }

    void TearDown() override {
        Env env;
        for (const auto& entry : ConfigManager::kConfigMap) {
            env[envName(entry)].clear();
        }
        if (home_) {
            env["HOME"] = *home_;
        } else {
            env["HOME"].clear();
        }
    }

    static std::string envName(const ConfigManager::Entry& entry) {
        return std::string(ConfigManager::kEnvPrefix) + std::string(entry.name);
    }

    void writeConfig(const std::filesystem::path& path,
                     const std::string& content) {
        writeFile(path, std::vector<uint8_t>(content.begin(), content.end()));
    }

    TempDir dir_;
    std::optional<std::string> home_;
};

TEST_F(ConfigManagerTest, ParsesCommandLine) {
    FakeArgv argv{"filetransfer_store", "--host", "10.0.0.2", "-p",
                  "6000", "-s", "4096", "input.bin"};
    ConfigManager manager(argv.line());
    ASSERT_TRUE(manager.loaded());

    EXPECT_EQ(manager.get(ConfigManager::Configs::HOST), "10.0.0.2");
    EXPECT_EQ(manager.get(ConfigManager::Configs::PORT), "6000");
    EXPECT_EQ(manager.get(ConfigManager::Configs::SOURCE), "input.bin");
    const auto size =
        manager.getNumber(ConfigManager::Configs::MAX_SEGMENT_SIZE, 1);
    ASSERT_TRUE(size.ok()) << size.status();
    EXPECT_EQ(*size, 4096U);
    EXPECT_FALSE(manager.has(ConfigManager::Configs::NAME));
    EXPECT_FALSE(manager.has(ConfigManager::Configs::HELP));
}

TEST_F(ConfigManagerTest, HelpFlagHasNoValue) {
    FakeArgv argv{"filetransfer_store", "--help"};
    ConfigManager manager(argv.line());
    EXPECT_TRUE(manager.has(ConfigManager::Configs::HELP));
    EXPECT_EQ(manager.get(ConfigManager::Configs::HELP), "");
}

TEST_F(ConfigManagerTest, UnknownOptionFailsToLoad) {
    FakeArgv argv{"filetransfer_store", "--no-such-option"};
    ConfigManager manager(argv.line());
    EXPECT_FALSE(manager.loaded());
}

TEST_F(ConfigManagerTest, EnvironmentUsesPrefix) {
    Env env;
    env["FILETRANSFER_SERVICE_ID"] = "from-env";
    env["FILETRANSFER_PORT"] = "7000";

    FakeArgv argv{"filetransfer_service", "--port", "7100"};
    ConfigManager manager(argv.line());
    EXPECT_EQ(manager.get(ConfigManager::Configs::SERVICE_ID), "from-env");
    // The command line wins over the environment
    EXPECT_EQ(manager.get(ConfigManager::Configs::PORT), "7100");
}

TEST_F(ConfigManagerTest, ReadsConfigFile) {
    const auto path = dir_.path() / "service.ini";
    writeConfig(path, "STORAGE_DIR=/srv/files\nIO_THREADS=8\n");

    FakeArgv argv{"filetransfer_service", "--config-file", path.string()};
    ConfigManager manager(argv.line());
    EXPECT_EQ(manager.get(ConfigManager::Configs::STORAGE_DIR), "/srv/files");
    const auto threads = manager.getNumber(ConfigManager::Configs::IO_THREADS, 4);
    ASSERT_TRUE(threads.ok());
    EXPECT_EQ(*threads, 8U);
}

TEST_F(ConfigManagerTest, ReadsDefaultConfigFromHome) {
    writeConfig(dir_.path() / std::string(ConfigManager::kDefaultConfigFile),
                "HOST=192.168.1.5\n");

    FakeArgv argv{"filetransfer_store"};
    ConfigManager manager(argv.line());
    EXPECT_EQ(manager.get(ConfigManager::Configs::HOST), "192.168.1.5");
}

TEST_F(ConfigManagerTest, InvalidNumberIsAnError) {
    FakeArgv argv{"filetransfer_service", "--io-threads", "many"};
    ConfigManager manager(argv.line());
    const auto threads = manager.getNumber(ConfigManager::Configs::IO_THREADS, 4);
    EXPECT_FALSE(threads.ok());
    EXPECT_EQ(threads.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ConfigManagerTest, MissingNumberUsesFallback) {
    FakeArgv argv{"filetransfer_service"};
    ConfigManager manager(argv.line());
    const auto port = manager.getNumber(ConfigManager::Configs::PORT, 50100);
    ASSERT_TRUE(port.ok());
    EXPECT_EQ(*port, 50100U);
}

TEST_F(ConfigManagerTest, HelpListsOptions) {
    std::ostringstream out;
    ConfigManager::serializeHelpToOStream(out);
    EXPECT_NE(out.str().find("--storage-dir"), std::string::npos);
    EXPECT_NE(out.str().find("--max-segment-size"), std::string::npos);
}

TEST(CommandLineTest, RejectsMissingArgv) {
    EXPECT_THROW(CommandLine(0, nullptr), std::invalid_argument);
    char* const empty[] = {nullptr};
    EXPECT_THROW(CommandLine(1, empty), std::invalid_argument);
}
