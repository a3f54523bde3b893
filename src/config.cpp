#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace {

std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open config file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

Config& Config::get() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::string content = readFile(path);
    // parse_in_arena copies the buffer, and every value is copied out
    // before the tree goes away.
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::ConstNodeRef root = tree.crootref();

    if (root.has_child("data_dir")) root["data_dir"] >> data_dir;
    if (root.has_child("db_path")) root["db_path"] >> db_path;
    if (root.has_child("chain_id")) root["chain_id"] >> chain_id;
    if (root.has_child("log_level")) root["log_level"] >> log_level;
    if (root.has_child("recent_page_size")) root["recent_page_size"] >> recent_page_size;

    finalize();
}

void Config::finalize() {
    if (db_path.empty()) {
        db_path = (std::filesystem::path(data_dir) / "suiter.db").string();
    }
    if (recent_page_size <= 0) {
        throw std::runtime_error("recent_page_size must be positive");
    }
}
