#include "cache/analysis_cache.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace onto {

// ============================================================================
// FileCache
// ============================================================================

FileCache::FileCache(std::string directory) : directory_(std::move(directory)) {}

std::string FileCache::path_for(const std::string& key) const {
    return (fs::path(directory_) / (key + ".json")).string();
}

std::optional<CacheEntry> FileCache::get(const std::string& key) const {
    std::string path = path_for(key);
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw CacheCorrupt(path + ": " + e.what());
    }

    if (!j.is_array() || j.size() != 2 || !j[0].is_number_unsigned()) {
        throw CacheCorrupt(path + ": expected [version, payload]");
    }

    CacheEntry entry;
    entry.version = j[0].get<size_t>();
    entry.bytes = j[1].dump();
    return entry;
}

void FileCache::put(const std::string& key, size_t version, const std::string& bytes) {
    fs::path path(path_for(key));
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::string payload = json::array({version, json::parse(bytes)}).dump();

    // Written beside the target and renamed so readers never see a partial entry
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to write cache file: " + path.string());
        }
        file << payload;
        file.close();
        if (file.fail()) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw std::runtime_error("Failed to write cache file: " + path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to write cache file: " + path.string() + " (" + ec.message() + ")");
    }
}

// ============================================================================
// MemoryCache
// ============================================================================

std::optional<CacheEntry> MemoryCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCache::put(const std::string& key, size_t version, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = CacheEntry{version, bytes};
}

size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Cache keys
// ============================================================================

std::string sanitize_class_iri(const std::string& class_iri) {
    std::string out;
    out.reserve(class_iri.size());
    for (char c : class_iri) {
        if (c == '<' || c == '>' || c == ':') continue;
        out += (c == '/') ? '_' : c;
    }
    return out;
}

std::string relations_cache_key(const std::string& dataset) {
    return dataset + "/relations";
}

std::string predicate_cache_key(const std::string& dataset, const std::string& class_iri) {
    return dataset + "/predicates/" + sanitize_class_iri(class_iri);
}

} // namespace onto
