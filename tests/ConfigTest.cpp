#include "models/Config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace QobuzDL;
namespace fs = std::filesystem;

TEST(ConfigTest, LoadsFileWithDefaults) {
    fs::path dir = fs::temp_directory_path() / "qobuzdl_config_test";
    fs::create_directories(dir);
    fs::path file = dir / "config.json";
    std::ofstream(file) << R"({
        "account": {"email": "me@example.com", "password": "5f4dcc3b5aa765d61d8327deb882cf99"},
        "app_id": 950096963,
        "secrets": ["s1", "s2"],
        "download": {"quality": 27, "max_workers": 4, "download_archive": true}
    })";
    
    Config config;
    ASSERT_TRUE(config.loadFromFile(file.string()));
    fs::remove_all(dir);
    
    EXPECT_EQ(config.account.email, "me@example.com");
    EXPECT_TRUE(config.account.hasPassword());
    EXPECT_FALSE(config.account.hasToken());
    EXPECT_EQ(config.app.appId, "950096963");
    EXPECT_EQ(config.app.secrets, (std::vector<std::string>{"s1", "s2"}));
    EXPECT_EQ(config.download.quality, 27);
    EXPECT_EQ(config.download.maxWorkers, 4);
    EXPECT_TRUE(config.download.downloadArchive);
    EXPECT_TRUE(config.download.qualityFallback);
    EXPECT_EQ(config.download.directory, "Qobuz Downloads");
    EXPECT_EQ(config.download.archivePath, (dir / "download_archive.txt").string());
    EXPECT_TRUE(config.isComplete());
}

TEST(ConfigTest, SecretsAsCommaSeparatedString) {
    fs::path file = fs::temp_directory_path() / "qobuzdl_config_secrets.json";
    std::ofstream(file) << R"({"app_id": "1", "secrets": " a, b ,,c ", "account": {"token": "t"}})";
    
    Config config;
    ASSERT_TRUE(config.loadFromFile(file.string()));
    fs::remove(file);
    
    EXPECT_EQ(config.app.secrets, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(config.account.hasToken());
}

TEST(ConfigTest, MissingOrBrokenFileFails) {
    Config config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/config.json"));
    
    fs::path file = fs::temp_directory_path() / "qobuzdl_config_broken.json";
    std::ofstream(file) << "{ not json";
    EXPECT_FALSE(config.loadFromFile(file.string()));
    fs::remove(file);
}

TEST(ConfigTest, LoadsFromEnvironment) {
    setenv("QOBUZ_APP_ID", "777", 1);
    setenv("QOBUZ_SECRETS", "x,y", 1);
    setenv("QOBUZ_TOKEN", "tok", 1);
    setenv("QOBUZ_QUALITY", "7", 1);
    setenv("QOBUZ_DRY_RUN", "true", 1);
    
    Config config;
    bool complete = config.loadFromEnvironment();
    
    unsetenv("QOBUZ_APP_ID");
    unsetenv("QOBUZ_SECRETS");
    unsetenv("QOBUZ_TOKEN");
    unsetenv("QOBUZ_QUALITY");
    unsetenv("QOBUZ_DRY_RUN");
    
    EXPECT_TRUE(complete);
    EXPECT_EQ(config.app.appId, "777");
    EXPECT_EQ(config.app.secrets.size(), 2u);
    EXPECT_EQ(config.download.quality, 7);
    EXPECT_TRUE(config.download.dryRun);
}

TEST(ConfigTest, ToJsonHidesSecrets) {
    Config config;
    config.app.secrets = {"very-secret"};
    config.account.passwordMd5 = "hash";
    
    std::string dumped = config.toJson().dump();
    EXPECT_EQ(dumped.find("very-secret"), std::string::npos);
    EXPECT_EQ(dumped.find("hash"), std::string::npos);
}
