#pragma once

#include "store/history_log.hpp"
#include "store/store.hpp"
#include <string>

namespace onto {

/**
 * @brief Connection settings for a SPARQL 1.1 Protocol endpoint
 */
struct SparqlEndpointConfig {
    std::string query_url;                  ///< e.g. http://localhost:7878/query
    std::string update_url;                 ///< e.g. http://localhost:7878/update
    std::string history_path;               ///< Audit log file
    int timeout_seconds = 60;               ///< Request timeout
    bool verbose = false;                   ///< Log every request
};

/**
 * @brief Store backed by a remote SPARQL endpoint over HTTP
 *
 * Queries and updates are sent as form-encoded POST requests; SELECT
 * results are requested as application/sparql-results+json.
 */
class SparqlHttpStore : public Store {
public:
    explicit SparqlHttpStore(SparqlEndpointConfig config);

    QueryRows query(const std::string& text) override;
    void update(const std::string& text) override;
    size_t history_version() const override;
    void write_history(const std::string& line) override;

    const HistoryLog& history() const { return history_; }

private:
    SparqlEndpointConfig config_;
    HistoryLog history_;
};

/**
 * @brief Decode a W3C SPARQL JSON results document
 * @throws QueryFailed if the document is not a SELECT result
 */
QueryRows parse_sparql_json_results(const std::string& body);

} // namespace onto
