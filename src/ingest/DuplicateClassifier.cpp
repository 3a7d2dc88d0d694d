#include "ingest/DuplicateClassifier.hpp"
#include "catalog/FieldValidators.hpp"
#include "server/Profiler.hpp"

namespace inventory {
namespace ingest {

DuplicateClassifier::DuplicateClassifier(CatalogNameIndex catalogNames)
    : m_catalogNames(std::move(catalogNames))
{
}

DuplicateClassifier DuplicateClassifier::fromStore(catalog::CatalogStore& store) {
    return DuplicateClassifier(buildIndex(store.listNames()));
}

CatalogNameIndex DuplicateClassifier::buildIndex(const std::vector<catalog::ProductName>& names) {
    CatalogNameIndex index;
    index.reserve(names.size());
    for (const auto& [id, name] : names) {
        index.emplace(catalog::normalizeName(name), id);  // keeps the first id
    }
    return index;
}

std::vector<Classification> DuplicateClassifier::classify(const std::vector<NormalizedRow>& rows) const {
    PROFILE_SCOPE("ingest.classify");

    std::vector<Classification> result;
    result.reserve(rows.size());

    std::unordered_map<std::string, size_t> seenInBatch;
    for (const auto& row : rows) {
        std::string key = catalog::normalizeName(row.name);
        Classification classification;

        auto seen = seenInBatch.find(key);
        if (seen != seenInBatch.end()) {
            classification.status = DuplicateStatus::DuplicateInBatch;
            classification.duplicateOf = seen->second;
        } else if (auto existing = m_catalogNames.find(key); existing != m_catalogNames.end()) {
            classification.status = DuplicateStatus::DuplicateInCatalog;
            classification.existingId = existing->second;
            // Later repeats collide with this row first, not with the catalog
            seenInBatch.emplace(std::move(key), row.ordinal);
        } else {
            classification.status = DuplicateStatus::New;
            seenInBatch.emplace(std::move(key), row.ordinal);
        }

        result.push_back(classification);
    }

    return result;
}

ClassificationSummary DuplicateClassifier::summarize(const std::vector<Classification>& classifications) {
    ClassificationSummary summary;
    for (const auto& c : classifications) {
        switch (c.status) {
            case DuplicateStatus::New: ++summary.newRows; break;
            case DuplicateStatus::DuplicateInBatch: ++summary.duplicatesInBatch; break;
            case DuplicateStatus::DuplicateInCatalog: ++summary.duplicatesInCatalog; break;
        }
    }
    return summary;
}

} // namespace ingest
} // namespace inventory
