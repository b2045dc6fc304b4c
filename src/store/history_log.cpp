#include "store/history_log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace onto {

HistoryLog::HistoryLog(std::string path) : path_(std::move(path)) {}

void HistoryLog::append(const std::string& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path p(path_);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open history file: " + path_);
    }
    file << entry << "\n";
}

size_t HistoryLog::line_count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        return 0;
    }
    size_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        count++;
    }
    return count;
}

std::string HistoryLog::read_all() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace onto
