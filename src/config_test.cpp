#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "config.hpp"

TEST(ConfigTest, Load)
{
    std::string test_file = "test_config_test.yaml";
    std::ofstream f(test_file);
    f << "data_dir: /var/lib/suiter\n"
      << "chain_id: testnet\n"
      << "log_level: debug\n"
      << "recent_page_size: 50\n";
    f.close();

    Config config;
    config.load(test_file);
    EXPECT_EQ(config.data_dir, "/var/lib/suiter");
    EXPECT_EQ(config.chain_id, "testnet");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.recent_page_size, 50);

    std::string expected_db =
        (std::filesystem::path("/var/lib/suiter") / "suiter.db").string();
    EXPECT_EQ(config.db_path, expected_db);

    std::filesystem::remove(test_file);
}

TEST(ConfigTest, ExplicitDbPathWins)
{
    std::string test_file = "test_config_db_path.yaml";
    std::ofstream f(test_file);
    f << "db_path: /tmp/other.db\n";
    f.close();

    Config config;
    config.load(test_file);
    EXPECT_EQ(config.db_path, "/tmp/other.db");
    EXPECT_EQ(config.chain_id, "local");
    EXPECT_EQ(config.recent_page_size, 20);

    std::filesystem::remove(test_file);
}

TEST(ConfigTest, Defaults)
{
    Config config;
    config.finalize();
    EXPECT_EQ(config.db_path,
              (std::filesystem::path(".") / "suiter.db").string());
    EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, MissingFileThrows)
{
    Config config;
    EXPECT_THROW(config.load("no_such_config.yaml"), std::runtime_error);
}
