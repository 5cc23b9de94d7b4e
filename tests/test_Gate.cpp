/**
 * runGate 测试：验证进程退出码 0 / 1 / 2 以及扫描目录相对当前工作目录解析。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/ExitStatus.h"
#include "core/Gate.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

static void createFile(const fs::path& p, const std::string& content) {
  std::ofstream f(p, std::ios::binary);
  ASSERT_TRUE(f.is_open()) << "create " << p.u8string();
  f << content;
  f.flush();
  ASSERT_TRUE(f) << "write " << p.u8string();
}

class GateTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = fs::temp_directory_path() / (std::string("cigate_gate_") + info->name());
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "src");
    originalCwd = fs::current_path();

    Logger::getInstance().setColor(false);
    Logger::getInstance().setCallback([this](LogLevel level, const std::string& msg) {
      if (level == LogLevel::ERROR) errors.push_back(msg);
    });
  }

  void TearDown() override {
    Logger::getInstance().setCallback(nullptr);
    fs::current_path(originalCwd);
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  GateConfig configFor(const fs::path& dir) const {
    GateConfig cfg = GateConfig::builtin();
    cfg.scanDirectory = dir.u8string();
    return cfg;
  }

  fs::path root;
  fs::path originalCwd;
  std::vector<std::string> errors;
};

TEST_F(GateTest, CleanDirectoryExitsZero) {
  createFile(root / "src" / "lib.rs", "// nothing risky\n");
  EXPECT_EQ(runGate(configFor(root / "src")), static_cast<int>(ExitStatus::Clean));
  EXPECT_TRUE(errors.empty());
}

TEST_F(GateTest, ViolationsExitOne) {
  createFile(root / "src" / "main.rs", "let x = result.unwrap();\n");
  EXPECT_EQ(runGate(configFor(root / "src")), static_cast<int>(ExitStatus::Violations));
}

TEST_F(GateTest, MissingDirectoryExitsTwo) {
  EXPECT_EQ(runGate(configFor(root / "missing")), static_cast<int>(ExitStatus::Fault));
  ASSERT_FALSE(errors.empty());
  EXPECT_NE(errors.back().find("FATAL ERROR"), std::string::npos) << errors.back();
}

TEST_F(GateTest, SubdirectoryEntryExitsTwo) {
  createFile(root / "src" / "main.rs", "let x = result.unwrap();\n");
  fs::create_directories(root / "src" / "nested");
  EXPECT_EQ(runGate(configFor(root / "src")), static_cast<int>(ExitStatus::Fault));
  ASSERT_FALSE(errors.empty());
  EXPECT_NE(errors.back().find("FATAL ERROR"), std::string::npos) << errors.back();
}

TEST_F(GateTest, BuiltinRulesResolveSrcAgainstWorkingDirectory) {
  createFile(root / "src" / "main.rs", "panic!(\"boom\");\n");
  fs::current_path(root);
  EXPECT_EQ(runGate(), static_cast<int>(ExitStatus::Violations));

  createFile(root / "src" / "main.rs", "panic!(\"boom\"); //#[allow_ci]\n");
  EXPECT_EQ(runGate(), static_cast<int>(ExitStatus::Clean));
}

TEST_F(GateTest, BuiltinRulesWithoutSrcExitTwo) {
  fs::remove_all(root / "src");
  fs::current_path(root);
  EXPECT_EQ(runGate(), static_cast<int>(ExitStatus::Fault));
}
