#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inventory {
namespace ingest {

/// A spreadsheet cell: string, number, boolean or null
using CellValue = nlohmann::json;

/**
 * One input row as received, keyed by the raw column label
 */
struct RawRow {
    size_t ordinal = 0;                           // 1-based, stable for the whole import
    std::map<std::string, CellValue> cells;
};

/**
 * One named table of a (possibly multi-sheet) input
 */
struct Sheet {
    std::string name;
    std::vector<std::string> columns;             // raw labels, input order
    std::vector<RawRow> rows;
};

/**
 * Why a typed field could not be produced from its cell
 */
enum class FieldIssue {
    None,
    Missing,        // absent or null cell
    NotNumeric,     // price cell that is not a number
    NotInteger      // quantity cell that is not a whole number
};

template <typename T>
struct CoercedField {
    std::optional<T> value;
    FieldIssue issue = FieldIssue::None;

    bool ok() const { return issue == FieldIssue::None && value.has_value(); }

    static CoercedField of(T v) { return CoercedField{v, FieldIssue::None}; }
    static CoercedField failed(FieldIssue why) { return CoercedField{std::nullopt, why}; }
};

/**
 * A row after column canonicalization and type coercion. Immutable once
 * built by TabularNormalizer.
 */
struct NormalizedRow {
    size_t ordinal = 0;
    std::map<std::string, CellValue> fields;      // canonical column -> raw cell
    std::string name;                             // trimmed, empty if absent
    std::string description;                      // trimmed, empty if absent
    CoercedField<double> price;
    CoercedField<int64_t> quantity;
};

enum class DuplicateStatus {
    New,
    DuplicateInBatch,
    DuplicateInCatalog
};

/**
 * Duplicate label of one row. existingId is set for DuplicateInCatalog,
 * duplicateOf (ordinal of the first occurrence) for DuplicateInBatch.
 */
struct Classification {
    DuplicateStatus status = DuplicateStatus::New;
    std::optional<int64_t> existingId;
    std::optional<size_t> duplicateOf;
};

enum class ResolutionPolicy {
    Skip,
    Update,
    CreateNew
};

std::string toString(DuplicateStatus status);
std::string toString(ResolutionPolicy policy);

/**
 * "skip", "update" or "create_new"; nullopt for anything else
 */
std::optional<ResolutionPolicy> parseResolutionPolicy(const std::string& value);

} // namespace ingest
} // namespace inventory
