#pragma once

#include "store/rdf_term.hpp"
#include <stdexcept>
#include <string>

namespace onto {

/**
 * @brief The store rejected or could not evaluate a query or update
 */
class QueryFailed : public std::runtime_error {
public:
    explicit QueryFailed(const std::string& message)
        : std::runtime_error("Query failed: " + message) {}
};

/**
 * @brief Abstract graph store the analyzer reads from and mutates
 *
 * Calls are blocking. Implementations used by the predicate analyzer
 * must tolerate concurrent query() calls from its worker pool.
 */
class Store {
public:
    virtual ~Store() = default;

    /**
     * @brief Evaluate a SELECT query
     * @throws QueryFailed
     */
    virtual QueryRows query(const std::string& text) = 0;

    /**
     * @brief Apply an INSERT/DELETE update
     * @throws QueryFailed
     */
    virtual void update(const std::string& text) = 0;

    /**
     * @brief Number of lines in the mutation audit log
     *
     * Used as the cache version stamp; never decreases.
     */
    virtual size_t history_version() const = 0;

    /**
     * @brief Append one entry to the mutation audit log
     */
    virtual void write_history(const std::string& line) = 0;
};

} // namespace onto
