#pragma once
#include <string>

struct Config
{
    std::string data_dir = ".";
    // Defaults to suiter.db under data_dir.
    std::string db_path;
    std::string chain_id = "local";
    std::string log_level = "info";
    int recent_page_size = 20;

    static Config& get();
    // Throws std::runtime_error if the file cannot be read.
    void load(const std::string& path);
    // Fill in the settings that depend on other settings.
    void finalize();
};
