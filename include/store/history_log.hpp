#pragma once

#include <mutex>
#include <string>

namespace onto {

/**
 * @brief Append-only audit log of structural mutations
 *
 * The line count doubles as the dataset's mutation version.
 */
class HistoryLog {
public:
    explicit HistoryLog(std::string path);

    void append(const std::string& entry);
    size_t line_count() const;
    std::string read_all() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace onto
