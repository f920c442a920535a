/// @file service_runner_test.cpp
/// @brief Unit tests for CLI argument parsing and config loading.

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include "sre/foundation/config_manager.hpp"
#include "sre/service/service_runner.hpp"

using namespace sre::service;
using sre::foundation::ConfigManager;
using sre::foundation::ErrorCode;

namespace {

// argv arrays are non-const in main(); keep storage alive for the test.
struct Argv {
    explicit Argv(std::initializer_list<const char*> args) {
        for (const char* a : args) {
            storage.emplace_back(a);
        }
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }

    int argc() const { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

// ============================================================================
// Argument parsing
// ============================================================================

TEST(ServiceRunnerArgsTest, ParseConfigArg) {
    Argv args{"sre_rank", "--dataset", "d.yaml", "--config", "/tmp/c.yaml"};
    EXPECT_EQ(parseConfigArg(args.argc(), args.argv()), "/tmp/c.yaml");
}

TEST(ServiceRunnerArgsTest, MissingConfigArgIsEmpty) {
    Argv args{"sre_rank", "--dataset", "d.yaml"};
    EXPECT_TRUE(parseConfigArg(args.argc(), args.argv()).empty());
}

TEST(ServiceRunnerArgsTest, TrailingFlagWithoutValue) {
    Argv args{"sre_rank", "--artist"};
    EXPECT_FALSE(parseArg(args.argc(), args.argv(), "--artist").has_value());
    EXPECT_TRUE(hasFlag(args.argc(), args.argv(), "--artist"));
}

TEST(ServiceRunnerArgsTest, ParseArgReturnsValue) {
    Argv args{"sre_rank", "--artist", "Demo Artist", "--verbose"};
    EXPECT_EQ(parseArg(args.argc(), args.argv(), "--artist").value(), "Demo Artist");
    EXPECT_TRUE(hasFlag(args.argc(), args.argv(), "--verbose"));
    EXPECT_FALSE(hasFlag(args.argc(), args.argv(), "--version"));
}

// ============================================================================
// Config loading
// ============================================================================

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("SRE_CONFIG_PATH");
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("sre_runner_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        ::unsetenv("SRE_CONFIG_PATH");
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(LoadConfigTest, EmptyPathLeavesDefaults) {
    ConfigManager config;
    auto result = loadConfig(config, {});
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(config.hasKey("ranking.solver.tolerance"));
}

TEST_F(LoadConfigTest, LoadsDefaultPath) {
    auto path = writeYaml("cfg.yaml", "ranking:\n  session:\n    rerank_every: 7\n");
    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.get<int>("ranking.session.rerank_every").value(), 7);
}

TEST_F(LoadConfigTest, EnvironmentOverridesPath) {
    auto fromArg = writeYaml("arg.yaml", "source: arg\n");
    auto fromEnv = writeYaml("env.yaml", "source: env\n");
    ::setenv("SRE_CONFIG_PATH", fromEnv.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fromArg).hasValue());
    EXPECT_EQ(config.get<std::string>("source").value(), "env");
}

TEST_F(LoadConfigTest, MissingFileIsLoadError) {
    ConfigManager config;
    auto result = loadConfig(config, tmpDir_ / "nope.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
