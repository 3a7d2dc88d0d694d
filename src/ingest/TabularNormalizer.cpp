#include "ingest/TabularNormalizer.hpp"
#include "catalog/FieldValidators.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace inventory {
namespace ingest {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
 */
bool isDecimalLiteral(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();

    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;

    size_t intDigits = 0;
    while (i < n && isDigit(s[i])) { ++i; ++intDigits; }

    size_t fracDigits = 0;
    if (i < n && s[i] == '.') {
        ++i;
        while (i < n && isDigit(s[i])) { ++i; ++fracDigits; }
    }
    if (intDigits + fracDigits == 0) return false;

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        size_t expDigits = 0;
        while (i < n && isDigit(s[i])) { ++i; ++expDigits; }
        if (expDigits == 0) return false;
    }

    return i == n;
}

const CellValue* findCell(const std::map<std::string, CellValue>& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

} // anonymous namespace

const std::vector<std::string>& TabularNormalizer::requiredColumns() {
    static const std::vector<std::string> columns = {"name", "description", "price", "quantity"};
    return columns;
}

std::string TabularNormalizer::canonicalColumnName(const std::string& raw) {
    std::string result;
    result.reserve(raw.size());

    bool pendingSeparator = false;
    for (char c : raw) {
        if (isSpace(c)) {
            pendingSeparator = !result.empty();
            continue;
        }
        if (pendingSeparator) {
            result += '_';
            pendingSeparator = false;
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string TabularNormalizer::cellToText(const CellValue* cell) {
    if (!cell || cell->is_null()) {
        return "";
    }
    if (cell->is_string()) {
        return catalog::trim(cell->get<std::string>());
    }
    return catalog::trim(cell->dump());
}

std::optional<double> TabularNormalizer::parseDecimal(const std::string& text) {
    std::string s = catalog::trim(text);
    if (s.empty()) {
        return std::nullopt;
    }

    if (s.find('.') == std::string::npos) {
        size_t comma = s.find(',');
        if (comma != std::string::npos) {
            if (s.find(',', comma + 1) != std::string::npos) {
                return std::nullopt;
            }
            s[comma] = '.';
        }
    }

    if (!isDecimalLiteral(s)) {
        return std::nullopt;
    }

    try {
        double value = std::stod(s);
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

CoercedField<double> TabularNormalizer::coercePrice(const CellValue* cell) {
    if (!cell || cell->is_null()) {
        return CoercedField<double>::failed(FieldIssue::Missing);
    }
    if (cell->is_number()) {
        double value = cell->get<double>();
        if (!std::isfinite(value)) {
            return CoercedField<double>::failed(FieldIssue::NotNumeric);
        }
        return CoercedField<double>::of(value);
    }
    if (cell->is_string()) {
        auto value = parseDecimal(cell->get<std::string>());
        if (!value) {
            return CoercedField<double>::failed(FieldIssue::NotNumeric);
        }
        return CoercedField<double>::of(*value);
    }
    return CoercedField<double>::failed(FieldIssue::NotNumeric);
}

CoercedField<int64_t> TabularNormalizer::coerceQuantity(const CellValue* cell) {
    if (!cell || cell->is_null()) {
        return CoercedField<int64_t>::failed(FieldIssue::Missing);
    }
    if (cell->is_number_integer()) {
        if (cell->is_number_unsigned() &&
            cell->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return CoercedField<int64_t>::failed(FieldIssue::NotInteger);
        }
        return CoercedField<int64_t>::of(cell->get<int64_t>());
    }
    if (cell->is_number_float()) {
        double value = cell->get<double>();
        if (!std::isfinite(value) || std::trunc(value) != value ||
            std::fabs(value) > 9.0e18) {
            return CoercedField<int64_t>::failed(FieldIssue::NotInteger);
        }
        return CoercedField<int64_t>::of(static_cast<int64_t>(value));
    }
    if (cell->is_string()) {
        std::string s = catalog::trim(cell->get<std::string>());
        size_t start = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
        if (start == s.size() ||
            !std::all_of(s.begin() + static_cast<std::ptrdiff_t>(start), s.end(), isDigit)) {
            return CoercedField<int64_t>::failed(FieldIssue::NotInteger);
        }
        try {
            return CoercedField<int64_t>::of(std::stoll(s));
        } catch (const std::out_of_range&) {
            return CoercedField<int64_t>::failed(FieldIssue::NotInteger);
        }
    }
    return CoercedField<int64_t>::failed(FieldIssue::NotInteger);
}

NormalizedRow TabularNormalizer::normalizeRow(const RawRow& row, size_t ordinal) {
    NormalizedRow normalized;
    normalized.ordinal = ordinal;

    // Cells are visited in byte order of their raw labels; when two labels
    // canonicalize to the same name, the smaller label wins
    for (const auto& [label, value] : row.cells) {
        normalized.fields.emplace(canonicalColumnName(label), value);
    }

    normalized.name = cellToText(findCell(normalized.fields, "name"));
    normalized.description = cellToText(findCell(normalized.fields, "description"));
    normalized.price = coercePrice(findCell(normalized.fields, "price"));
    normalized.quantity = coerceQuantity(findCell(normalized.fields, "quantity"));
    return normalized;
}

std::vector<NormalizedRow> TabularNormalizer::normalize(const std::vector<RawRow>& rows) {
    std::vector<NormalizedRow> result;
    result.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        result.push_back(normalizeRow(rows[i], i + 1));
    }
    return result;
}

bool TabularNormalizer::looksNumeric(const CellValue& cell) {
    if (cell.is_number()) {
        return true;
    }
    if (cell.is_string()) {
        return parseDecimal(cell.get<std::string>()).has_value();
    }
    return false;
}

bool TabularNormalizer::isDigitString(const CellValue& cell) {
    if (cell.is_number_unsigned()) {
        return true;
    }
    if (cell.is_number_integer()) {
        return cell.get<int64_t>() >= 0;
    }
    if (cell.is_string()) {
        const auto& s = cell.get_ref<const std::string&>();
        return !s.empty() && std::all_of(s.begin(), s.end(), isDigit);
    }
    return false;
}

SheetReport TabularNormalizer::validateSheet(const Sheet& sheet) {
    SheetReport report;
    report.name = sheet.name;
    report.rows = sheet.rows.size();

    std::set<std::string> present;
    for (const auto& label : sheet.columns) {
        std::string canonical = canonicalColumnName(label);
        if (present.insert(canonical).second) {
            report.columns.push_back(canonical);
        }
    }

    for (const auto& required : requiredColumns()) {
        if (present.count(required) == 0) {
            report.missingColumns.push_back(required);
        }
    }
    std::sort(report.missingColumns.begin(), report.missingColumns.end());

    if (!report.missingColumns.empty()) {
        std::string list;
        for (const auto& col : report.missingColumns) {
            if (!list.empty()) list += ", ";
            list += col;
        }
        report.errors.push_back("Missing required columns: " + list);
    }

    if (sheet.rows.empty()) {
        report.errors.push_back("Sheet is empty");
    }

    const bool hasPrice = present.count("price") > 0;
    const bool hasQuantity = present.count("quantity") > 0;
    static const CellValue nullCell;

    for (const auto& raw : sheet.rows) {
        NormalizedRow row = normalizeRow(raw, raw.ordinal);
        if (hasPrice) {
            const CellValue* cell = findCell(row.fields, "price");
            if (!looksNumeric(cell ? *cell : nullCell)) ++report.invalidPriceCells;
        }
        if (hasQuantity) {
            const CellValue* cell = findCell(row.fields, "quantity");
            if (!isDigitString(cell ? *cell : nullCell)) ++report.invalidQuantityCells;
        }
    }

    if (report.invalidPriceCells > 0) {
        report.warnings.push_back(std::to_string(report.invalidPriceCells) + " rows with invalid prices");
    }
    if (report.invalidQuantityCells > 0) {
        report.warnings.push_back(std::to_string(report.invalidQuantityCells) + " rows with invalid quantities");
    }

    report.isValid = report.errors.empty();
    return report;
}

WorkbookAnalysis TabularNormalizer::analyze(const std::vector<Sheet>& sheets) {
    WorkbookAnalysis analysis;
    for (const auto& sheet : sheets) {
        SheetReport report = validateSheet(sheet);
        if (report.isValid) {
            analysis.validSheets.push_back(report.name);
        }
        analysis.sheets.push_back(std::move(report));
    }

    if (analysis.validSheets.size() == 1) {
        analysis.selectedSheet = analysis.validSheets.front();
    }
    return analysis;
}

nlohmann::json SheetReport::toJson() const {
    return nlohmann::json{
        {"name", name},
        {"rows", rows},
        {"columns", columns},
        {"is_valid", isValid},
        {"errors", errors},
        {"warnings", warnings},
        {"missing_columns", missingColumns}
    };
}

nlohmann::json WorkbookAnalysis::toJson() const {
    nlohmann::json sheetsJson = nlohmann::json::array();
    for (const auto& sheet : sheets) {
        sheetsJson.push_back(sheet.toJson());
    }
    return nlohmann::json{
        {"sheets", sheetsJson},
        {"selected_sheet", selectedSheet ? nlohmann::json(*selectedSheet) : nlohmann::json(nullptr)},
        {"total_sheets", sheets.size()},
        {"valid_sheets", validSheets}
    };
}

} // namespace ingest
} // namespace inventory
