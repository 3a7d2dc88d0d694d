#pragma once

#include "catalog/CatalogStore.hpp"
#include "ingest/Types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace inventory {
namespace ingest {

/// normalized name -> id of the first catalog product carrying it
using CatalogNameIndex = std::unordered_map<std::string, int64_t>;

struct ClassificationSummary {
    size_t newRows = 0;
    size_t duplicatesInBatch = 0;
    size_t duplicatesInCatalog = 0;

    size_t duplicates() const { return duplicatesInBatch + duplicatesInCatalog; }
};

/**
 * Labels each row new / duplicate_in_batch / duplicate_in_catalog in one
 * ordinal-order pass. The catalog side is a snapshot taken before the pass;
 * the classifier never writes to the store.
 */
class DuplicateClassifier {
public:
    explicit DuplicateClassifier(CatalogNameIndex catalogNames);

    /**
     * Snapshot the store's current names
     */
    static DuplicateClassifier fromStore(catalog::CatalogStore& store);

    static CatalogNameIndex buildIndex(const std::vector<catalog::ProductName>& names);

    /**
     * One classification per row, same order. Rows must be sorted by ordinal.
     */
    std::vector<Classification> classify(const std::vector<NormalizedRow>& rows) const;

    static ClassificationSummary summarize(const std::vector<Classification>& classifications);

    size_t catalogSize() const { return m_catalogNames.size(); }

private:
    CatalogNameIndex m_catalogNames;
};

} // namespace ingest
} // namespace inventory
