#include <catch2/catch_test_macros.hpp>
#include "ingest/DuplicateClassifier.hpp"
#include "ingest/TabularNormalizer.hpp"
#include "catalog/SqliteCatalogStore.hpp"
#include "TestSupport.hpp"

using namespace inventory::ingest;
using inventory::catalog::SqliteCatalogStore;
using testsupport::json;
using testsupport::productRow;

namespace {

std::vector<NormalizedRow> rowsNamed(const std::vector<std::string>& names) {
    json rows = json::array();
    for (const auto& name : names) {
        rows.push_back(productRow(name, "d", 1, 1));
    }
    return TabularNormalizer::normalize(testsupport::rawRows(rows));
}

} // anonymous namespace

TEST_CASE("Rows are new, batch or catalog duplicates", "[DuplicateClassifier]") {
    DuplicateClassifier classifier(DuplicateClassifier::buildIndex({{7, "Hammer"}}));

    auto rows = rowsNamed({"Bolt", "bolt ", "HAMMER", "Nut", "BOLT"});
    auto result = classifier.classify(rows);
    REQUIRE(result.size() == 5);

    CHECK(result[0].status == DuplicateStatus::New);

    CHECK(result[1].status == DuplicateStatus::DuplicateInBatch);
    CHECK(result[1].duplicateOf == 1u);

    CHECK(result[2].status == DuplicateStatus::DuplicateInCatalog);
    CHECK(result[2].existingId == 7);
    CHECK_FALSE(result[2].duplicateOf.has_value());

    CHECK(result[3].status == DuplicateStatus::New);

    CHECK(result[4].status == DuplicateStatus::DuplicateInBatch);
    CHECK(result[4].duplicateOf == 1u);
}

TEST_CASE("Repeats of a catalog duplicate are batch duplicates", "[DuplicateClassifier]") {
    DuplicateClassifier classifier(DuplicateClassifier::buildIndex({{3, "Saw"}}));

    auto result = classifier.classify(rowsNamed({"saw", "Saw", "SAW"}));

    CHECK(result[0].status == DuplicateStatus::DuplicateInCatalog);
    CHECK(result[1].status == DuplicateStatus::DuplicateInBatch);
    CHECK(result[1].duplicateOf == 1u);
    CHECK(result[2].status == DuplicateStatus::DuplicateInBatch);
    CHECK(result[2].duplicateOf == 1u);
}

TEST_CASE("Catalog index keeps the first id per name", "[DuplicateClassifier]") {
    auto index = DuplicateClassifier::buildIndex({{4, "Drill"}, {9, " drill"}});
    CHECK(index.size() == 1);
    CHECK(index.at("drill") == 4);
}

TEST_CASE("Summary counts add up to the row count", "[DuplicateClassifier]") {
    DuplicateClassifier classifier(DuplicateClassifier::buildIndex({{1, "A"}, {2, "B"}}));

    auto rows = rowsNamed({"A", "B", "C", "a", "c", "D", "D", "E"});
    auto summary = DuplicateClassifier::summarize(classifier.classify(rows));

    CHECK(summary.duplicatesInCatalog == 2);
    CHECK(summary.duplicatesInBatch == 3);
    CHECK(summary.newRows == 3);
    CHECK(summary.newRows + summary.duplicates() == rows.size());
}

TEST_CASE("Classifier snapshots the store without writing", "[DuplicateClassifier]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    auto existing = store.insert({std::nullopt, "Wrench", "Adjustable", 12.0, 3});
    store.commit();

    auto classifier = DuplicateClassifier::fromStore(store);
    CHECK(classifier.catalogSize() == 1);

    auto result = classifier.classify(rowsNamed({"wrench", "Pliers"}));
    CHECK(result[0].status == DuplicateStatus::DuplicateInCatalog);
    CHECK(result[0].existingId == existing.id);
    CHECK(result[1].status == DuplicateStatus::New);

    CHECK(store.listAll().size() == 1);
    CHECK_FALSE(store.inTransaction());
}
