#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <gtest/gtest.h>

#include "core/Downloader.h"
#include "TestDoubles.h"

namespace bdmtest {

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() /
            ("bdm_downloader_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path tempDir;
    std::ostringstream logSink;
    Logger logger{ logSink, LogLevel::Warn };
    const std::string url = "https://example.test/data/archive.tar";
};

TEST_F(DownloaderTest, WritesResourceToDestination) {
    FakeServer server(makePayload(10000));
    DownloadConfig cfg = defaultDownloadConfig();
    cfg.fixedSegmentSizeBytes = 1024;
    cfg.maxConcurrentDownloads = 4;

    Downloader downloader(cfg, logger, server.factory());
    auto target = tempDir / "archive.tar";
    DownloadResult result = downloader.download(url, target.string());

    ASSERT_TRUE(result.success) << result.error.message();
    EXPECT_EQ(result.bytesWritten, 10000u);
    EXPECT_EQ(std::filesystem::file_size(target), 10000u);
    EXPECT_EQ(readFile(target), server.data);
}

TEST_F(DownloaderTest, DoesNotTruncateExistingFile) {
    auto target = tempDir / "existing.bin";
    {
        std::ofstream out(target, std::ios::binary);
        out << std::string(150, '#');
    }

    FakeServer server(makePayload(100));
    Downloader downloader(defaultDownloadConfig(), logger, server.factory());
    DownloadResult result = downloader.download(url, target.string());

    ASSERT_TRUE(result.success) << result.error.message();
    const std::string contents = readFile(target);
    ASSERT_EQ(contents.size(), 150u);
    EXPECT_EQ(contents.substr(0, 100), server.data);
    EXPECT_EQ(contents.substr(100), std::string(50, '#'));
}

TEST_F(DownloaderTest, FailureIsWrappedWithUrlAndDestination) {
    FakeServer server(makePayload(100));
    server.headStatus = 404;

    Downloader downloader(defaultDownloadConfig(), logger, server.factory());
    auto target = tempDir / "missing.bin";
    DownloadResult result = downloader.download(url, target.string());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind(), ErrorKind::NotFound);
    EXPECT_EQ(result.error.url(), url);
    EXPECT_EQ(result.error.path(), target.string());

    const std::string expectedPrefix = "failed to download file from " + url + " to " + target.string() + "; error: ";
    EXPECT_EQ(result.error.message().rfind(expectedPrefix, 0), 0u) << result.error.message();
    EXPECT_EQ(result.error.message(),
        expectedPrefix + "failed to get file size of file at " + url + "; error: file not found at " + url);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(DownloaderTest, UnwritableDestinationIsWriteError) {
    FakeServer server(makePayload(100));
    DownloadConfig cfg = defaultDownloadConfig();
    cfg.maxRetries = 2;

    Downloader downloader(cfg, logger, server.factory());
    auto target = tempDir / "no" / "such" / "dir" / "file.bin";
    DownloadResult result = downloader.download(url, target.string());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind(), ErrorKind::WriteFailed);
    EXPECT_EQ(result.attempts, 2u);
    EXPECT_NE(result.error.message().find("failed to write to file at offset 0; size: 100"), std::string::npos);
    EXPECT_NE(logSink.str().find("[WARN] Attempt 1/2 failed"), std::string::npos);
}

TEST_F(DownloaderTest, EachCallUsesFreshPlan) {
    FakeServer small(makePayload(300));
    FakeServer large(makePayload(3 * MiB));
    DownloadConfig cfg = defaultDownloadConfig();

    Downloader downloader(cfg, logger, small.factory());
    ASSERT_TRUE(downloader.download(url, (tempDir / "small.bin").string()).success);
    EXPECT_EQ(small.getCount, 1u);

    Downloader second(cfg, logger, large.factory());
    DownloadResult result = second.download(url, (tempDir / "large.bin").string());
    ASSERT_TRUE(result.success) << result.error.message();
    EXPECT_EQ(large.getCount, 4u);
    EXPECT_EQ(readFile(tempDir / "large.bin"), large.data);
    EXPECT_EQ(downloader.config().fixedSegmentSizeBytes, -1);
}

} // namespace bdmtest
