/**
 * @file test_spdlog_backend.cpp
 * @brief Tests for the spdlog-backed backend
 * @brief 基于 spdlog 的后端测试
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include <cpputil/log/spdlog_backend.hpp>

namespace cpputil {
namespace log {
namespace test {

namespace fs = std::filesystem;

class SpdlogBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() / (std::string("cpputil_spdlog_") + info->name());
        fs::remove_all(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    static std::string ReadFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    AppenderSpec FileSpec(const std::string& name, Level threshold = Level::Trace) const {
        AppenderSpec spec;
        spec.name = name;
        spec.kind = AppenderKind::File;
        spec.path = (m_dir / (name + ".log")).string();
        spec.threshold = threshold;
        spec.pattern = "%l|%v";
        return spec;
    }

    fs::path m_dir;
};

TEST(SpdlogLevelTest, Mapping) {
    static_assert(ToSpdlogLevel(Level::Trace) == spdlog::level::trace, "trace");
    EXPECT_EQ(ToSpdlogLevel(Level::Debug), spdlog::level::debug);
    EXPECT_EQ(ToSpdlogLevel(Level::Info), spdlog::level::info);
    EXPECT_EQ(ToSpdlogLevel(Level::Warn), spdlog::level::warn);
    EXPECT_EQ(ToSpdlogLevel(Level::Error), spdlog::level::err);
    EXPECT_EQ(ToSpdlogLevel(Level::Off), spdlog::level::off);
}

/**
 * @brief Test root level and per-sink thresholds, with parent directories created
 * @brief 测试根级别与每个 Sink 的阈值，并创建父目录
 */
TEST_F(SpdlogBackendTest, FileSinksAndThresholds) {
    LoggingPlan plan;
    plan.rootLevel = Level::Debug;
    plan.appenders.push_back(FileSpec("all"));
    plan.appenders.push_back(FileSpec("errors", Level::Error));

    std::shared_ptr<SpdlogBackend> backend;
    Status status = SpdlogBackend::Create(plan, backend);
    ASSERT_TRUE(status) << status.ToString();
    EXPECT_EQ(backend->Name(), "spdlog");
    EXPECT_EQ(backend->GetLevel(), Level::Debug);
    EXPECT_EQ(backend->GetLogger()->sinks().size(), 2u);

    EXPECT_FALSE(backend->Log(Level::Trace, "hidden"));
    EXPECT_TRUE(backend->Log(Level::Debug, "sample"));
    EXPECT_TRUE(backend->Log(Level::Error, "broken"));
    backend->Close();

    EXPECT_EQ(ReadFile(m_dir / "all.log"), "debug|sample\nerror|broken\n");
    EXPECT_EQ(ReadFile(m_dir / "errors.log"), "error|broken\n");
    EXPECT_FALSE(backend->Log(Level::Error, "after close"));
}

/**
 * @brief Test the private logger is not registered in spdlog's registry
 * @brief 测试私有日志器未注册到 spdlog 注册表
 */
TEST_F(SpdlogBackendTest, LoggerIsNotRegistered) {
    LoggingPlan plan;
    plan.appenders.push_back(FileSpec("private"));

    std::shared_ptr<SpdlogBackend> backend;
    ASSERT_TRUE(SpdlogBackend::Create(plan, backend));
    EXPECT_EQ(backend->GetLogger()->name(), SpdlogBackend::kLoggerName);
    EXPECT_EQ(spdlog::get(SpdlogBackend::kLoggerName), nullptr);
}

TEST_F(SpdlogBackendTest, RollingFile) {
    LoggingPlan plan;
    plan.rootLevel = Level::Info;
    AppenderSpec spec = FileSpec("roll");
    spec.kind = AppenderKind::RollingFile;
    spec.maxSize = 64;
    spec.maxFiles = 2;
    spec.pattern = "%v";
    plan.appenders.push_back(spec);

    std::shared_ptr<SpdlogBackend> backend;
    ASSERT_TRUE(SpdlogBackend::Create(plan, backend));
    for (int i = 0; i < 20; ++i) {
        backend->Log(Level::Info, "rolling line " + std::to_string(i));
    }
    backend->Flush();

    EXPECT_TRUE(fs::exists(m_dir / "roll.log"));
    EXPECT_TRUE(fs::exists(m_dir / "roll.1.log"));
    EXPECT_FALSE(fs::exists(m_dir / "roll.3.log"));
}

TEST_F(SpdlogBackendTest, UnopenableFileFails) {
    fs::create_directories(m_dir);
    LoggingPlan plan;
    AppenderSpec spec = FileSpec("dir");
    spec.path = m_dir.string();
    plan.appenders.push_back(spec);

    std::shared_ptr<SpdlogBackend> backend;
    Status status = SpdlogBackend::Create(plan, backend);
    EXPECT_EQ(status.Code(), ErrorCode::FileOpenFailed);
    EXPECT_EQ(backend, nullptr);
}

}  // namespace test
}  // namespace log
}  // namespace cpputil
