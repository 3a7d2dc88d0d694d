#include "ingest/SheetReader.hpp"
#include <set>
#include <sstream>
#include <stdexcept>

namespace inventory {
namespace ingest {

Sheet SheetReader::fromRows(const std::string& name, const nlohmann::json& rows) {
    if (!rows.is_array()) {
        throw std::invalid_argument("Sheet '" + name + "': rows must be an array");
    }

    Sheet sheet;
    sheet.name = name;
    sheet.rows.reserve(rows.size());

    std::set<std::string> seenColumns;
    size_t ordinal = 0;
    for (const auto& item : rows) {
        ++ordinal;
        if (!item.is_object()) {
            throw std::invalid_argument("Sheet '" + name + "': row " +
                                        std::to_string(ordinal) + " is not an object");
        }

        RawRow row;
        row.ordinal = ordinal;
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (seenColumns.insert(it.key()).second) {
                sheet.columns.push_back(it.key());
            }
            row.cells.emplace(it.key(), it.value());
        }
        sheet.rows.push_back(std::move(row));
    }

    return sheet;
}

std::vector<Sheet> SheetReader::fromJson(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("Expected a JSON object with 'sheets' or 'rows'");
    }

    std::vector<Sheet> sheets;

    if (body.contains("sheets")) {
        const auto& sheetsJson = body["sheets"];
        if (!sheetsJson.is_array()) {
            throw std::invalid_argument("'sheets' must be an array");
        }
        std::set<std::string> names;
        for (const auto& sheetJson : sheetsJson) {
            if (!sheetJson.is_object() || !sheetJson.contains("rows")) {
                throw std::invalid_argument("Each sheet needs a 'rows' array");
            }
            std::string name = sheetJson.value("name", "Sheet" + std::to_string(sheets.size() + 1));
            if (!names.insert(name).second) {
                throw std::invalid_argument("Duplicate sheet name: " + name);
            }
            sheets.push_back(fromRows(name, sheetJson["rows"]));
        }
        if (sheets.empty()) {
            throw std::invalid_argument("'sheets' is empty");
        }
        return sheets;
    }

    if (body.contains("rows")) {
        sheets.push_back(fromRows(kDefaultSheetName, body["rows"]));
        return sheets;
    }

    throw std::invalid_argument("Expected a JSON object with 'sheets' or 'rows'");
}

Sheet SheetReader::fromCsv(const std::string& text, const std::string& sheetName, char delimiter) {
    Sheet sheet;
    sheet.name = sheetName;

    std::istringstream input(text);
    std::string line;
    bool headerRead = false;
    size_t ordinal = 0;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto fields = parseCsvLine(line, delimiter);

        if (!headerRead) {
            sheet.columns = std::move(fields);
            headerRead = true;
            continue;
        }

        RawRow row;
        row.ordinal = ++ordinal;
        for (size_t i = 0; i < sheet.columns.size(); ++i) {
            if (i < fields.size() && !fields[i].empty()) {
                row.cells.emplace(sheet.columns[i], fields[i]);
            } else {
                row.cells.emplace(sheet.columns[i], nullptr);
            }
        }
        sheet.rows.push_back(std::move(row));
    }

    if (!headerRead) {
        throw std::invalid_argument("CSV input has no header line");
    }

    return sheet;
}

std::vector<std::string> SheetReader::parseCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    auto pushField = [&]() {
        size_t start = field.find_first_not_of(" \t");
        size_t end = field.find_last_not_of(" \t");
        if (start == std::string::npos) {
            fields.push_back("");
        } else {
            fields.push_back(field.substr(start, end - start + 1));
        }
        field.clear();
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
        } else {
            field += c;
        }
    }
    pushField();

    return fields;
}

} // namespace ingest
} // namespace inventory
