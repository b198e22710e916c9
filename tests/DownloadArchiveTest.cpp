#include "core/DownloadArchive.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace QobuzDL;
namespace fs = std::filesystem;

namespace {

class DownloadArchiveTest : public ::testing::Test {
protected:
    fs::path dir;
    
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("qobuzdl_archive_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }
    
    void TearDown() override {
        fs::remove_all(dir);
    }
    
    std::size_t lineCount(const fs::path& file) {
        std::ifstream in(file);
        std::size_t lines = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++lines;
        }
        return lines;
    }
};

} // namespace

TEST_F(DownloadArchiveTest, AddIsIdempotentWithinSession) {
    fs::path file = dir / "sub" / "archive.txt";
    DownloadArchive archive(file.string());
    ASSERT_TRUE(archive.load());
    
    EXPECT_FALSE(archive.contains("42"));
    EXPECT_TRUE(archive.add("42"));
    EXPECT_TRUE(archive.contains("42"));
    EXPECT_FALSE(archive.add("42"));
    
    EXPECT_EQ(archive.size(), 1u);
    EXPECT_EQ(lineCount(file), 1u);
}

TEST_F(DownloadArchiveTest, PersistsAcrossSessions) {
    fs::path file = dir / "archive.txt";
    {
        DownloadArchive first(file.string());
        first.load();
        first.add("1");
        first.add("2");
    }
    
    DownloadArchive second(file.string());
    ASSERT_TRUE(second.load());
    EXPECT_TRUE(second.contains("1"));
    EXPECT_TRUE(second.contains("2"));
    EXPECT_FALSE(second.add("2"));
    EXPECT_TRUE(second.add("3"));
    EXPECT_EQ(lineCount(file), 3u);
}

TEST_F(DownloadArchiveTest, ToleratesCrlfAndBlankLines) {
    fs::create_directories(dir);
    fs::path file = dir / "archive.txt";
    std::ofstream(file) << "10\r\n\r\n20\n";
    
    DownloadArchive archive(file.string());
    ASSERT_TRUE(archive.load());
    EXPECT_EQ(archive.size(), 2u);
    EXPECT_TRUE(archive.contains("10"));
    EXPECT_TRUE(archive.contains("20"));
}

TEST_F(DownloadArchiveTest, DisabledArchiveKnowsNothing) {
    DownloadArchive archive;
    EXPECT_FALSE(archive.isEnabled());
    EXPECT_TRUE(archive.load());
    EXPECT_FALSE(archive.add("1"));
    EXPECT_FALSE(archive.contains("1"));
}

TEST_F(DownloadArchiveTest, ReadOnlyArchiveNeverWrites) {
    fs::create_directories(dir);
    fs::path file = dir / "archive.txt";
    std::ofstream(file) << "7\n";
    
    DownloadArchive archive(file.string(), true);
    archive.load();
    EXPECT_TRUE(archive.contains("7"));
    EXPECT_FALSE(archive.add("8"));
    EXPECT_FALSE(archive.contains("8"));
    EXPECT_EQ(lineCount(file), 1u);
}

TEST_F(DownloadArchiveTest, ConcurrentAddsWriteEachIdOnce) {
    fs::path file = dir / "archive.txt";
    DownloadArchive archive(file.string());
    archive.load();
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&archive]() {
            for (int i = 0; i < 50; ++i) {
                archive.add(std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(archive.size(), 50u);
    EXPECT_EQ(lineCount(file), 50u);
}
