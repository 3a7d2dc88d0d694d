#include "server/RequestHandler.hpp"
#include "catalog/FieldValidators.hpp"
#include "ingest/DuplicateClassifier.hpp"
#include "ingest/SheetReader.hpp"
#include "ingest/TabularNormalizer.hpp"
#include "server/Logger.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>
#include <stdexcept>

namespace inventory {
namespace server {

namespace {

json productsToJson(const std::vector<catalog::Product>& products) {
    json array = json::array();
    for (const auto& p : products) {
        array.push_back(p.toJson());
    }
    return array;
}

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

std::optional<int64_t> parseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(value)) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::string requestedSheet(const QueryParams& query) {
    auto it = query.find("sheet_name");
    return it != query.end() ? it->second : "";
}

double toMegabytes(size_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // anonymous namespace

RequestHandler::RequestHandler(catalog::CatalogStoreFactory storeFactory, size_t maxUploadBytes)
    : m_storeFactory(std::move(storeFactory))
    , m_maxUploadBytes(maxUploadBytes)
{
}

// =============================================================================
// Routing
// =============================================================================

RouteResult RequestHandler::route(const std::string& method,
                                  const std::string& target,
                                  const std::string& body,
                                  const std::string& contentType)
{
    auto [path, query] = splitTarget(target);

    // "/products/" and "/products" are the same route
    if (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    if (method == "GET" && path == "/") {
        return handleRoot();
    }

    if (method == "GET" && path == "/health") {
        return handleHealth();
    }

    // ============================================================
    // Products API
    // ============================================================

    if (path == "/products") {
        if (method == "POST") return handleCreateProduct(body);
        if (method == "GET") return handleListProducts();
    }

    if (method == "GET" && path == "/products/filter") {
        return handleFilterProducts(query);
    }

    if (method == "GET" && path == "/products/low-stock") {
        return handleLowStock(query);
    }

    if (method == "GET" && path == "/products/high-stock") {
        return handleHighStock(query);
    }

    const std::string productsPrefix = "/products/";
    if (path.rfind(productsPrefix, 0) == 0) {
        std::string idText = path.substr(productsPrefix.size());
        if (idText.find('/') == std::string::npos &&
            (method == "GET" || method == "PUT" || method == "DELETE")) {
            auto id = parseInteger(idText);
            if (!id) {
                return {400, envelope(400, "error", "Invalid product id",
                                      "Product id must be an integer", nullptr, idText)};
            }
            if (method == "GET") return handleGetProduct(*id);
            if (method == "PUT") return handleUpdateProduct(*id, body);
            return handleDeleteProduct(*id);
        }
    }

    // ============================================================
    // Upload analysis API
    // ============================================================

    if (method == "POST" && path == "/upload/analyze") {
        return handleAnalyze(body, contentType);
    }

    if (method == "POST" && path == "/upload/preview") {
        return handlePreview(body, contentType, query);
    }

    if (method == "POST" && path == "/upload/validate-duplicates") {
        return handleValidateDuplicates(body, contentType, query);
    }

    return {404, errorBody("Not found: " + target)};
}

// =============================================================================
// Service endpoints
// =============================================================================

RouteResult RequestHandler::handleRoot() {
    return {200, json{{"message", "Welcome to the inventory API"}}};
}

RouteResult RequestHandler::handleHealth() {
    return {200, json{{"status", "ok"}}};
}

// =============================================================================
// Product endpoints
// =============================================================================

std::variant<catalog::Product, RouteResult> RequestHandler::parseProduct(
    const std::string& body, const std::string& errorTitle) const
{
    json request;
    try {
        request = json::parse(body);
    } catch (const json::parse_error& e) {
        return RouteResult{400, envelope(400, "error", errorTitle, "Invalid JSON", nullptr, e.what())};
    }

    if (!request.is_object()) {
        return RouteResult{400, envelope(400, "error", errorTitle,
                                         "Expected a JSON object", nullptr, "Invalid body")};
    }

    auto fail = [&](const std::string& error) {
        return RouteResult{400, envelope(400, "error", errorTitle,
                                         "Invalid product data", nullptr, error)};
    };

    for (const char* field : {"name", "description"}) {
        if (!request.contains(field) || !request[field].is_string()) {
            return fail("Field '" + std::string(field) + "' must be a string");
        }
    }
    if (!request.contains("price") || !request["price"].is_number()) {
        return fail("Field 'price' must be a number");
    }
    if (!request.contains("quantity") || !request["quantity"].is_number_integer()) {
        return fail("Field 'quantity' must be an integer");
    }

    catalog::Product product;
    product.name = catalog::trim(request["name"].get<std::string>());
    product.description = catalog::trim(request["description"].get<std::string>());
    product.price = request["price"].get<double>();
    product.quantity = request["quantity"].get<int64_t>();

    if (auto error = catalog::firstValidationError(product.name, product.description,
                                                   product.price, product.quantity)) {
        return fail(*error);
    }

    return product;
}

RouteResult RequestHandler::handleCreateProduct(const std::string& body) {
    auto parsed = parseProduct(body, "Error creating product");
    if (auto* rejected = std::get_if<RouteResult>(&parsed)) {
        return *rejected;
    }

    try {
        auto store = m_storeFactory();
        catalog::Product created = store->insert(std::get<catalog::Product>(parsed));
        store->commit();
        LOG_INFO("Product created: id=" + std::to_string(*created.id) + " name='" + created.name + "'");
        return {201, envelope(201, "success", "Product created",
                              "The product was created successfully", created.toJson())};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error creating product",
                              "Could not create the product", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleListProducts() {
    try {
        auto store = m_storeFactory();
        return {200, envelope(200, "success", "Product list",
                              "Products retrieved successfully", productsToJson(store->listAll()))};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error retrieving products",
                              "Could not retrieve the product list", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleFilterProducts(const QueryParams& query) {
    auto it = query.find("min_price");
    std::optional<double> minPrice;
    if (it != query.end()) {
        minPrice = parseNumber(it->second);
    }
    if (!minPrice) {
        return {400, envelope(400, "error", "Error filtering products",
                              "Query parameter 'min_price' must be a number", nullptr,
                              it == query.end() ? "missing min_price" : it->second)};
    }

    try {
        auto store = m_storeFactory();
        return {200, envelope(200, "success", "Filtered products",
                              "Products filtered successfully",
                              productsToJson(store->filterByMinPrice(*minPrice)))};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error filtering products",
                              "Could not filter products", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleLowStock(const QueryParams& query) {
    int64_t threshold = 10;
    auto it = query.find("threshold");
    if (it != query.end()) {
        auto parsed = parseInteger(it->second);
        if (!parsed) {
            return {400, envelope(400, "error", "Error retrieving products",
                                  "Query parameter 'threshold' must be an integer", nullptr, it->second)};
        }
        threshold = *parsed;
    }

    try {
        auto store = m_storeFactory();
        auto products = store->lowStock(threshold);
        return {200, envelope(200, "success", "Low stock products",
                              "Found " + std::to_string(products.size()) +
                              " products with fewer than " + std::to_string(threshold) + " units",
                              productsToJson(products))};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error retrieving products",
                              "Could not retrieve the product list", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleHighStock(const QueryParams& query) {
    int64_t limit = 5;
    auto it = query.find("limit");
    if (it != query.end()) {
        auto parsed = parseInteger(it->second);
        if (!parsed || *parsed < 0) {
            return {400, envelope(400, "error", "Error retrieving products",
                                  "Query parameter 'limit' must be a non-negative integer",
                                  nullptr, it->second)};
        }
        limit = *parsed;
    }

    try {
        auto store = m_storeFactory();
        auto products = store->highStock(static_cast<size_t>(limit));
        return {200, envelope(200, "success", "Highest stock products",
                              "Found " + std::to_string(products.size()) +
                              " products with the highest quantity",
                              productsToJson(products))};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error retrieving products",
                              "Could not retrieve the product list", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleGetProduct(int64_t id) {
    try {
        auto store = m_storeFactory();
        auto product = store->findById(id);
        if (!product) {
            return {404, envelope(404, "error", "Product not found",
                                  "No product exists with that id")};
        }
        return {200, envelope(200, "success", "Product retrieved",
                              "Product retrieved successfully", product->toJson())};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error retrieving product",
                              "Could not retrieve the product", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleUpdateProduct(int64_t id, const std::string& body) {
    auto parsed = parseProduct(body, "Error updating product");
    if (auto* rejected = std::get_if<RouteResult>(&parsed)) {
        return *rejected;
    }

    try {
        auto store = m_storeFactory();
        if (!store->findById(id)) {
            return {404, envelope(404, "error", "Product not found",
                                  "No product exists with that id")};
        }

        catalog::Product product = std::get<catalog::Product>(parsed);
        product.id = id;
        store->update(product);
        store->commit();
        return {200, envelope(200, "success", "Product updated",
                              "The product was updated successfully", product.toJson())};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error updating product",
                              "Could not update the product", nullptr, e.what())};
    }
}

RouteResult RequestHandler::handleDeleteProduct(int64_t id) {
    try {
        auto store = m_storeFactory();
        auto product = store->findById(id);
        if (!product || !store->remove(id)) {
            return {404, envelope(404, "error", "Product not found",
                                  "No product exists with that id")};
        }
        store->commit();
        LOG_INFO("Product deleted: id=" + std::to_string(id));
        return {200, envelope(200, "success", "Product deleted",
                              "The product was deleted successfully", product->toJson())};
    } catch (const catalog::StoreError& e) {
        return {500, envelope(500, "error", "Error deleting product",
                              "Could not delete the product", nullptr, e.what())};
    }
}

// =============================================================================
// Upload analysis endpoints
// =============================================================================

std::optional<RouteResult> RequestHandler::checkUploadSize(const std::string& body) const {
    if (body.size() <= m_maxUploadBytes) {
        return std::nullopt;
    }
    char message[128];
    std::snprintf(message, sizeof(message), "Upload exceeds the %.0f MB limit (size: %.2f MB)",
                  toMegabytes(m_maxUploadBytes), toMegabytes(body.size()));
    return RouteResult{400, errorBody(message)};
}

std::vector<ingest::Sheet> RequestHandler::readSheets(const std::string& body,
                                                      const std::string& contentType)
{
    if (contentType.find("text/csv") != std::string::npos) {
        return {ingest::SheetReader::fromCsv(body)};
    }

    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Invalid JSON: " + std::string(e.what()));
    }
    return ingest::SheetReader::fromJson(parsed);
}

const ingest::Sheet* RequestHandler::selectSheet(const std::vector<ingest::Sheet>& sheets,
                                                 const QueryParams& query)
{
    auto it = query.find("sheet_name");
    if (it == query.end() || it->second.empty()) {
        return sheets.empty() ? nullptr : &sheets.front();
    }
    for (const auto& sheet : sheets) {
        if (sheet.name == it->second) {
            return &sheet;
        }
    }
    return nullptr;
}

std::vector<std::string> RequestHandler::previewColumns(const ingest::Sheet& sheet) {
    std::vector<std::string> columns{"temp_id"};
    std::set<std::string> seen;
    for (const auto& raw : sheet.columns) {
        std::string canonical = ingest::TabularNormalizer::canonicalColumnName(raw);
        if (seen.insert(canonical).second) {
            columns.push_back(canonical);
        }
    }
    return columns;
}

json RequestHandler::previewRow(const ingest::NormalizedRow& row,
                                const std::vector<std::string>& columns)
{
    json out = json::object();
    out["temp_id"] = row.ordinal;
    for (size_t i = 1; i < columns.size(); ++i) {
        auto it = row.fields.find(columns[i]);
        out[columns[i]] = it != row.fields.end() ? it->second : json(nullptr);
    }
    return out;
}

RouteResult RequestHandler::handleAnalyze(const std::string& body, const std::string& contentType) {
    if (auto rejected = checkUploadSize(body)) {
        return *rejected;
    }

    try {
        auto sheets = readSheets(body, contentType);
        auto analysis = ingest::TabularNormalizer::analyze(sheets);
        LOG_INFO("Upload analyzed: " + std::to_string(sheets.size()) + " sheets, " +
                 std::to_string(analysis.validSheets.size()) + " valid");

        return {200, json{
            {"success", true},
            {"data", analysis.toJson()},
            {"file_size_mb", std::round(toMegabytes(body.size()) * 100.0) / 100.0}
        }};
    } catch (const std::invalid_argument& e) {
        return {400, errorBody("Error processing upload: " + std::string(e.what()))};
    }
}

RouteResult RequestHandler::handlePreview(const std::string& body, const std::string& contentType,
                                          const QueryParams& query)
{
    if (auto rejected = checkUploadSize(body)) {
        return *rejected;
    }

    try {
        auto sheets = readSheets(body, contentType);
        const ingest::Sheet* sheet = selectSheet(sheets, query);
        if (!sheet) {
            return {400, errorBody("Error generating preview: sheet not found: " +
                                   requestedSheet(query))};
        }

        auto columns = previewColumns(*sheet);
        auto rows = ingest::TabularNormalizer::normalize(sheet->rows);

        json previewRows = json::array();
        for (size_t i = 0; i < rows.size() && i < kPreviewRowLimit; ++i) {
            previewRows.push_back(previewRow(rows[i], columns));
        }

        return {200, json{
            {"success", true},
            {"data", {
                {"sheet_name", sheet->name},
                {"preview_rows", previewRows},
                {"total_rows", rows.size()},
                {"columns", columns}
            }}
        }};
    } catch (const std::invalid_argument& e) {
        return {400, errorBody("Error generating preview: " + std::string(e.what()))};
    }
}

RouteResult RequestHandler::handleValidateDuplicates(const std::string& body,
                                                     const std::string& contentType,
                                                     const QueryParams& query)
{
    if (auto rejected = checkUploadSize(body)) {
        return *rejected;
    }

    try {
        auto sheets = readSheets(body, contentType);
        const ingest::Sheet* sheet = selectSheet(sheets, query);
        if (!sheet) {
            return {400, errorBody("Error: sheet not found: " + requestedSheet(query))};
        }

        auto columns = previewColumns(*sheet);
        auto rows = ingest::TabularNormalizer::normalize(sheet->rows);

        auto store = m_storeFactory();
        auto classifier = ingest::DuplicateClassifier::fromStore(*store);
        auto classifications = classifier.classify(rows);
        auto summary = ingest::DuplicateClassifier::summarize(classifications);

        json previewRows = json::array();
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& c = classifications[i];
            json out = previewRow(rows[i], columns);
            out["status"] = ingest::toString(c.status);
            out["existing_id"] = c.existingId ? json(*c.existingId) : json(nullptr);
            out["duplicate_row"] = c.duplicateOf ? json(*c.duplicateOf) : json(nullptr);
            previewRows.push_back(std::move(out));
        }

        LOG_INFO("Duplicate check on '" + sheet->name + "': " +
                 std::to_string(summary.duplicates()) + " duplicates, " +
                 std::to_string(summary.newRows) + " new (catalog size " +
                 std::to_string(classifier.catalogSize()) + ")");

        return {200, json{
            {"success", true},
            {"data", {
                {"sheet_name", sheet->name},
                {"preview_rows", previewRows},
                {"total_rows", rows.size()},
                {"columns", columns},
                {"duplicates_found", summary.duplicates()},
                {"duplicates_in_batch", summary.duplicatesInBatch},
                {"duplicates_in_catalog", summary.duplicatesInCatalog},
                {"new_products", summary.newRows},
                {"has_duplicates", summary.duplicates() > 0}
            }}
        }};
    } catch (const std::invalid_argument& e) {
        return {400, errorBody("Error: " + std::string(e.what()))};
    } catch (const catalog::StoreError& e) {
        return {500, errorBody("Error: " + std::string(e.what()))};
    }
}

// =============================================================================
// Helpers
// =============================================================================

json RequestHandler::envelope(unsigned status, const std::string& type,
                              const std::string& title, const std::string& message,
                              const json& data, const std::string& error)
{
    json body = {
        {"status", status},
        {"type", type},
        {"title", title},
        {"message", message}
    };
    if (!data.is_null()) {
        body["data"] = data;
    }
    if (!error.empty()) {
        body["error"] = error;
    }
    return body;
}

std::string RequestHandler::urlDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            result += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

std::pair<std::string, QueryParams> RequestHandler::splitTarget(const std::string& target) {
    QueryParams query;
    size_t qpos = target.find('?');
    if (qpos == std::string::npos) {
        return {target, query};
    }

    std::string path = target.substr(0, qpos);
    std::string queryString = target.substr(qpos + 1);

    size_t pos = 0;
    while (pos <= queryString.size()) {
        size_t amp = queryString.find('&', pos);
        if (amp == std::string::npos) amp = queryString.size();
        std::string pair = queryString.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                query[urlDecode(pair)] = "";
            } else {
                query[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }

    return {path, query};
}

} // namespace server
} // namespace inventory
