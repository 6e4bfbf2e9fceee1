#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <gtest/gtest.h>

#include "io/FileWriter.h"

namespace bdmtest {

class FileWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "bdm_file_writer_test";
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
};

TEST_F(FileWriterTest, CreatesFileOnFirstWrite) {
    auto target = tempDir / "new.bin";
    FileWriter writer(target.string());

    std::size_t written = 0;
    std::string error;
    ASSERT_TRUE(writer.writeAt("abc", 3, 0, written, error)) << error;

    EXPECT_EQ(written, 3u);
    EXPECT_EQ(readFile(target), "abc");
}

TEST_F(FileWriterTest, WritesAtOffsetLeavingHole) {
    auto target = tempDir / "sparse.bin";
    FileWriter writer(target.string());

    std::size_t written = 0;
    std::string error;
    ASSERT_TRUE(writer.writeAt("tail", 4, 10, written, error)) << error;
    ASSERT_TRUE(writer.writeAt("head", 4, 0, written, error)) << error;

    const std::string contents = readFile(target);
    ASSERT_EQ(contents.size(), 14u);
    EXPECT_EQ(contents.substr(0, 4), "head");
    EXPECT_EQ(contents.substr(4, 6), std::string(6, '\0'));
    EXPECT_EQ(contents.substr(10), "tail");
}

TEST_F(FileWriterTest, OverwritesWithoutTruncating) {
    auto target = tempDir / "existing.bin";
    {
        std::ofstream out(target, std::ios::binary);
        out << "0123456789";
    }

    FileWriter writer(target.string());
    std::size_t written = 0;
    std::string error;
    ASSERT_TRUE(writer.writeAt("ab", 2, 3, written, error)) << error;

    EXPECT_EQ(readFile(target), "012ab56789");
}

TEST_F(FileWriterTest, RepeatedWriteIsIdempotent) {
    auto target = tempDir / "twice.bin";
    FileWriter writer(target.string());

    std::size_t written = 0;
    std::string error;
    ASSERT_TRUE(writer.writeAt("xyz", 3, 5, written, error)) << error;
    ASSERT_TRUE(writer.writeAt("xyz", 3, 5, written, error)) << error;

    EXPECT_EQ(std::filesystem::file_size(target), 8u);
}

TEST_F(FileWriterTest, ReportsOpenFailure) {
    FileWriter writer((tempDir / "missing" / "file.bin").string());

    std::size_t written = 42;
    std::string error;
    EXPECT_FALSE(writer.writeAt("abc", 3, 0, written, error));
    EXPECT_EQ(written, 0u);
    EXPECT_EQ(error.rfind("open failed: ", 0), 0u) << error;
}

} // namespace bdmtest
