#include "store/sparql_http_store.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iostream>
#include <mutex>
#include <vector>

using json = nlohmann::json;

namespace onto {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string url_encode(CURL* curl, const std::string& text) {
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        throw QueryFailed("could not URL-encode request");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// POST a single form field; returns the response body
std::string http_post_form(
    const std::string& url,
    const std::string& field,
    const std::string& value,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    ensure_curl_initialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw QueryFailed("failed to initialize CURL");
    }

    std::string response;
    std::string payload;
    try {
        payload = field + "=" + url_encode(curl, value);
    } catch (const QueryFailed&) {
        curl_easy_cleanup(curl);
        throw;
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/x-www-form-urlencoded");
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw QueryFailed("HTTP request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw QueryFailed(
            "endpoint returned HTTP " + std::to_string(http_code) + ": " + response
        );
    }

    return response;
}

} // anonymous namespace

// ============================================================================
// SPARQL JSON results
// ============================================================================

QueryRows parse_sparql_json_results(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw QueryFailed(std::string("malformed results document: ") + e.what());
    }

    if (!j.contains("results") || !j["results"].contains("bindings")) {
        throw QueryFailed("response is not a SELECT result set");
    }

    QueryRows rows;
    try {
        for (const auto& binding : j["results"]["bindings"]) {
            QueryRow row;
            for (const auto& [var, term] : binding.items()) {
                row[var] = RdfTerm::from_sparql_json(term);
            }
            rows.push_back(std::move(row));
        }
    } catch (const std::exception& e) {
        throw QueryFailed(std::string("invalid binding in results: ") + e.what());
    }
    return rows;
}

// ============================================================================
// SparqlHttpStore
// ============================================================================

SparqlHttpStore::SparqlHttpStore(SparqlEndpointConfig config)
    : config_(std::move(config)), history_(config_.history_path) {}

QueryRows SparqlHttpStore::query(const std::string& text) {
    if (config_.verbose) {
        std::cout << "[sparql] query:\n" << text << std::endl;
    }
    std::string body = http_post_form(
        config_.query_url, "query", text,
        {"Accept: application/sparql-results+json"},
        config_.timeout_seconds
    );
    return parse_sparql_json_results(body);
}

void SparqlHttpStore::update(const std::string& text) {
    if (config_.verbose) {
        std::cout << "[sparql] update:\n" << text << std::endl;
    }
    http_post_form(config_.update_url, "update", text, {}, config_.timeout_seconds);
}

size_t SparqlHttpStore::history_version() const {
    return history_.line_count();
}

void SparqlHttpStore::write_history(const std::string& line) {
    history_.append(line);
}

} // namespace onto
