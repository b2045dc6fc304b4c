#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace onto {

/**
 * @brief A cached payload stamped with the mutation version it was computed at
 */
struct CacheEntry {
    size_t version = 0;
    std::string bytes;
};

/**
 * @brief Cached data could not be decoded; callers treat this as a miss
 */
class CacheCorrupt : public std::runtime_error {
public:
    explicit CacheCorrupt(const std::string& message)
        : std::runtime_error("Cache corrupt: " + message) {}
};

/**
 * @brief Versioned key-value cache
 */
class KeyValueCache {
public:
    virtual ~KeyValueCache() = default;

    /**
     * @throws CacheCorrupt if an entry exists but cannot be read back
     */
    virtual std::optional<CacheEntry> get(const std::string& key) const = 0;

    virtual void put(const std::string& key, size_t version, const std::string& bytes) = 0;
};

/**
 * @brief One JSON document per key under a cache directory
 *
 * A key "books/relations" lives at "<directory>/books/relations.json";
 * the document is the pair [version, payload].
 */
class FileCache : public KeyValueCache {
public:
    explicit FileCache(std::string directory);

    std::optional<CacheEntry> get(const std::string& key) const override;
    void put(const std::string& key, size_t version, const std::string& bytes) override;

    std::string path_for(const std::string& key) const;

private:
    std::string directory_;
};

class MemoryCache : public KeyValueCache {
public:
    std::optional<CacheEntry> get(const std::string& key) const override;
    void put(const std::string& key, size_t version, const std::string& bytes) override;

    size_t size() const;

private:
    std::map<std::string, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Cache keys
// ============================================================================

// "<http://schema.org/Book>" -> "http__schema.org_Book"
std::string sanitize_class_iri(const std::string& class_iri);

std::string relations_cache_key(const std::string& dataset);

std::string predicate_cache_key(const std::string& dataset, const std::string& class_iri);

} // namespace onto
