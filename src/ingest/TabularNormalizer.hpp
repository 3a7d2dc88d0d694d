#pragma once

#include "ingest/Types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inventory {
namespace ingest {

/**
 * Sheet-level validation result
 */
struct SheetReport {
    std::string name;
    size_t rows = 0;
    std::vector<std::string> columns;             // canonical
    std::vector<std::string> missingColumns;      // sorted
    size_t invalidPriceCells = 0;
    size_t invalidQuantityCells = 0;
    std::vector<std::string> errors;              // make the sheet invalid
    std::vector<std::string> warnings;            // advisory only
    bool isValid = false;

    nlohmann::json toJson() const;
};

/**
 * Validation of every sheet of an input, with the auto-selected sheet
 */
struct WorkbookAnalysis {
    std::vector<SheetReport> sheets;
    std::vector<std::string> validSheets;
    std::optional<std::string> selectedSheet;     // set only if exactly one sheet is valid

    nlohmann::json toJson() const;
};

/**
 * Column canonicalization, cell coercion and sheet validation
 */
class TabularNormalizer {
public:
    /**
     * name, description, price, quantity
     */
    static const std::vector<std::string>& requiredColumns();

    /**
     * Trimmed, lower-cased, whitespace runs replaced by a single '_'
     */
    static std::string canonicalColumnName(const std::string& raw);

    /**
     * Normalize rows, assigning ordinals 1..n in input order
     */
    static std::vector<NormalizedRow> normalize(const std::vector<RawRow>& rows);

    static NormalizedRow normalizeRow(const RawRow& row, size_t ordinal);

    /**
     * Numbers as-is; strings through parseDecimal; null/absent is Missing
     */
    static CoercedField<double> coercePrice(const CellValue* cell);

    /**
     * Integral numbers, or strings of an optional sign followed by digits
     */
    static CoercedField<int64_t> coerceQuantity(const CellValue* cell);

    /**
     * Finite decimal number; a single ',' is the decimal separator when
     * the string has no '.'. "1,50" -> 1.5
     */
    static std::optional<double> parseDecimal(const std::string& text);

    /**
     * Analysis-time price check (advisory)
     */
    static bool looksNumeric(const CellValue& cell);

    /**
     * Analysis-time quantity check (advisory): a non-negative JSON integer
     * or a non-empty string made only of ASCII digits
     */
    static bool isDigitString(const CellValue& cell);

    static SheetReport validateSheet(const Sheet& sheet);
    static WorkbookAnalysis analyze(const std::vector<Sheet>& sheets);

private:
    static std::string cellToText(const CellValue* cell);
};

} // namespace ingest
} // namespace inventory
