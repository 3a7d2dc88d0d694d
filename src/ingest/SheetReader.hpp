#pragma once

#include "ingest/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace inventory {
namespace ingest {

/**
 * Builds Sheets from the already-decoded forms a client can send:
 * JSON row objects, or CSV text.
 *
 * Accepted JSON bodies:
 *   {"sheets": [{"name": "Stock", "rows": [{"Name": "Bolt", ...}, ...]}, ...]}
 *   {"rows": [...]}                      -> one sheet named "Sheet1"
 */
class SheetReader {
public:
    static constexpr const char* kDefaultSheetName = "Sheet1";

    /**
     * Throws std::invalid_argument on an unexpected shape
     */
    static std::vector<Sheet> fromJson(const nlohmann::json& body);

    /**
     * Rows must be an array of objects. Ordinals are 1-based positions.
     */
    static Sheet fromRows(const std::string& name, const nlohmann::json& rows);

    /**
     * Header line first. Empty fields become null cells, others strings.
     */
    static Sheet fromCsv(const std::string& text,
                         const std::string& sheetName = kDefaultSheetName,
                         char delimiter = ',');

    static std::vector<std::string> parseCsvLine(const std::string& line, char delimiter);
};

} // namespace ingest
} // namespace inventory
