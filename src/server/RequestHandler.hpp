#pragma once

#include "catalog/CatalogStore.hpp"
#include "ingest/Types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace inventory {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/// Decoded query string
using QueryParams = std::map<std::string, std::string>;

/**
 * Request handler - business logic of the HTTP endpoints.
 *
 * Stateless apart from its configuration: each request opens its own store
 * through the factory, so one handler serves every session concurrently.
 */
class RequestHandler {
public:
    static constexpr size_t kPreviewRowLimit = 100;

    RequestHandler(catalog::CatalogStoreFactory storeFactory, size_t maxUploadBytes);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /**
     * Dispatch one request. Throws only on unexpected failures, which the
     * session turns into a 500.
     */
    RouteResult route(const std::string& method,
                      const std::string& target,
                      const std::string& body,
                      const std::string& contentType = "application/json");

    size_t maxUploadBytes() const { return m_maxUploadBytes; }

    // Service endpoints
    RouteResult handleRoot();
    RouteResult handleHealth();

    // Product endpoints
    RouteResult handleCreateProduct(const std::string& body);
    RouteResult handleListProducts();
    RouteResult handleFilterProducts(const QueryParams& query);
    RouteResult handleLowStock(const QueryParams& query);
    RouteResult handleHighStock(const QueryParams& query);
    RouteResult handleGetProduct(int64_t id);
    RouteResult handleUpdateProduct(int64_t id, const std::string& body);
    RouteResult handleDeleteProduct(int64_t id);

    // Upload analysis endpoints
    RouteResult handleAnalyze(const std::string& body, const std::string& contentType);
    RouteResult handlePreview(const std::string& body, const std::string& contentType,
                              const QueryParams& query);
    RouteResult handleValidateDuplicates(const std::string& body, const std::string& contentType,
                                         const QueryParams& query);

    // Helpers
    static std::pair<std::string, QueryParams> splitTarget(const std::string& target);
    static std::string urlDecode(const std::string& text);

    /**
     * {status, type, title, message, data?, error?}
     */
    static json envelope(unsigned status, const std::string& type,
                         const std::string& title, const std::string& message,
                         const json& data = nullptr, const std::string& error = "");

    /**
     * JSON body ({"sheets": ...} or {"rows": ...}) or CSV text, by content type
     */
    static std::vector<ingest::Sheet> readSheets(const std::string& body,
                                                 const std::string& contentType);

private:
    /**
     * Body decoded into a product, or the 400 result explaining why not
     */
    std::variant<catalog::Product, RouteResult> parseProduct(const std::string& body,
                                                             const std::string& errorTitle) const;

    std::optional<RouteResult> checkUploadSize(const std::string& body) const;

    /**
     * Sheet named by ?sheet_name=, else the first one. nullptr if unknown.
     */
    static const ingest::Sheet* selectSheet(const std::vector<ingest::Sheet>& sheets,
                                            const QueryParams& query);

    /**
     * temp_id followed by the canonical column names, first-seen order
     */
    static std::vector<std::string> previewColumns(const ingest::Sheet& sheet);
    static json previewRow(const ingest::NormalizedRow& row,
                           const std::vector<std::string>& columns);

    catalog::CatalogStoreFactory m_storeFactory;
    size_t m_maxUploadBytes;
};

} // namespace server
} // namespace inventory
