#include <catch2/catch_test_macros.hpp>
#include "ingest/BatchCommitCoordinator.hpp"
#include "catalog/SqliteCatalogStore.hpp"
#include "TestSupport.hpp"

using namespace inventory::ingest;
using namespace inventory::catalog;
using testsupport::json;
using testsupport::productRow;

namespace {

struct ImportRun {
    std::vector<ChunkProgress> chunks;
    ImportState state = ImportState::Idle;
};

ImportRun runImport(CatalogStore& store, ImportSession& session, const json& rows) {
    ImportRun run;
    BatchCommitCoordinator coordinator(store, session);

    auto batch = coordinator.validate(testsupport::rawRows(rows));
    coordinator.process(batch.rows, [&](const ChunkProgress& chunk) {
        run.chunks.push_back(chunk);
    });
    coordinator.save();
    coordinator.complete();

    run.state = coordinator.state();
    return run;
}

} // anonymous namespace

// =============================================================================
// Happy path
// =============================================================================

TEST_CASE("New rows are created in chunks of ten", "[BatchCommitCoordinator]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    ImportSession session("ch_test", 25, ResolutionPolicy::Skip);

    auto run = runImport(store, session, testsupport::generatedRows(25));

    CHECK(run.state == ImportState::Complete);
    CHECK(session.counters().created == 25);
    CHECK(session.errorCount() == 0);
    CHECK(session.progress() == 100);

    REQUIRE(run.chunks.size() == 3);
    CHECK(run.chunks[0].rowsDone == 10);
    CHECK(run.chunks[1].rowsDone == 20);
    CHECK(run.chunks[2].rowsDone == 25);
    CHECK(run.chunks[2].chunksDone == 3);
    CHECK(run.chunks[2].chunksTotal == 3);

    CHECK_FALSE(store.inTransaction());
    SqliteCatalogStore reader(tempDb.path());
    CHECK(reader.listAll().size() == 25);
}

TEST_CASE("Counters and errors add up to the row count", "[BatchCommitCoordinator]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    store.insert({std::nullopt, "Existing", "Old", 1.0, 1});
    store.commit();

    json rows = json::array({
        productRow("Fresh", "ok", 1, 1),
        productRow("existing", "new text", 2, 2),
        productRow("", "no name", 1, 1),
        productRow("Cheap", "x", -1, 1),
        productRow("Fresh", "repeat", 3, 3)
    });
    ImportSession session("ch_test", rows.size(), ResolutionPolicy::Skip);
    runImport(store, session, rows);

    const auto& c = session.counters();
    CHECK(c.created == 1);
    CHECK(c.skipped == 2);
    CHECK(c.updated == 0);
    CHECK(session.errorCount() == 2);
    CHECK(c.created + c.updated + c.skipped + session.errorCount() == rows.size());
}

// =============================================================================
// Resolution policies
// =============================================================================

TEST_CASE("skip leaves existing products untouched", "[BatchCommitCoordinator][policy]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    auto existing = store.insert({std::nullopt, "Widget", "Original", 5.0, 50});
    store.commit();

    ImportSession session("ch_test", 1, ResolutionPolicy::Skip);
    runImport(store, session, json::array({productRow("WIDGET", "Changed", 9.0, 1)}));

    CHECK(session.counters().skipped == 1);
    auto product = store.findById(*existing.id);
    REQUIRE(product.has_value());
    CHECK(product->description == "Original");
    CHECK(product->price == 5.0);
    CHECK(product->quantity == 50);
    CHECK(store.listAll().size() == 1);
}

TEST_CASE("update overwrites description, price and quantity only", "[BatchCommitCoordinator][policy]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    auto existing = store.insert({std::nullopt, "Widget", "Original", 5.0, 50});
    store.commit();

    ImportSession session("ch_test", 1, ResolutionPolicy::Update);
    runImport(store, session, json::array({productRow(" widget ", "Changed", "7,25", "8")}));

    CHECK(session.counters().updated == 1);
    auto product = store.findById(*existing.id);
    REQUIRE(product.has_value());
    CHECK(product->name == "Widget");
    CHECK(product->description == "Changed");
    CHECK(product->price == 7.25);
    CHECK(product->quantity == 8);
    CHECK(store.listAll().size() == 1);
}

TEST_CASE("create_new inserts a second product with the same name", "[BatchCommitCoordinator][policy]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    store.insert({std::nullopt, "Widget", "Original", 5.0, 50});
    store.commit();

    ImportSession session("ch_test", 1, ResolutionPolicy::CreateNew);
    runImport(store, session, json::array({productRow("Widget", "Second", 6.0, 1)}));

    CHECK(session.counters().created == 1);
    auto all = store.listAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].name == "Widget");
    CHECK(all[1].name == "Widget");
    CHECK(all[1].description == "Second");
}

TEST_CASE("Repeated name in one batch under update", "[BatchCommitCoordinator][policy]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    ImportSession session("ch_test", 2, ResolutionPolicy::Update);

    runImport(store, session, json::array({
        productRow("Lamp", "first", 1.0, 1),
        productRow("LAMP", "second", 2.0, 2)
    }));

    // The second row finds the first through the fresh lookup
    CHECK(session.counters().created == 1);
    CHECK(session.counters().updated == 1);
    auto all = store.listAll();
    REQUIRE(all.size() == 1);
    CHECK(all[0].description == "second");
}

// =============================================================================
// Row validation
// =============================================================================

TEST_CASE("Row errors name the row and the first failing rule", "[BatchCommitCoordinator][validation]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    json rows = json::array({
        productRow("", "", -1, -1),
        productRow("A", " ", 1, 1),
        productRow("B", "b", "abc", 1),
        productRow("C", "c", -0.5, 1),
        productRow("D", "d", 1, "many"),
        productRow("E", "e", 1, -4),
        productRow("F", "f", nullptr, 1),
        {{"name", "G"}, {"description", "g"}, {"price", 1}}
    });
    ImportSession session("ch_test", rows.size(), ResolutionPolicy::Skip);
    runImport(store, session, rows);

    CHECK(session.errors() == std::vector<std::string>{
        "Row 1: empty name",
        "Row 2: empty description",
        "Row 3: invalid price",
        "Row 4: negative price",
        "Row 5: invalid quantity",
        "Row 6: negative quantity",
        "Row 7: invalid price",
        "Row 8: invalid quantity"
    });
    CHECK(session.counters().written() == 0);
    CHECK(store.listAll().empty());
}

TEST_CASE("Comma decimal price is stored as a number", "[BatchCommitCoordinator][validation]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    ImportSession session("ch_test", 1, ResolutionPolicy::Skip);

    runImport(store, session, json::array({productRow("Gum", "Mint", "1,50", 10.0)}));

    auto product = store.findByNameCi("gum");
    REQUIRE(product.has_value());
    CHECK(product->price == 1.5);
    CHECK(product->quantity == 10);
}

TEST_CASE("A store error on one row does not stop the import", "[BatchCommitCoordinator][validation]") {
    testsupport::TempDatabase tempDb;
    testsupport::FaultyStore store(std::make_unique<SqliteCatalogStore>(tempDb.path()));
    store.failInsertOf("Item 2");

    ImportSession session("ch_test", 3, ResolutionPolicy::Skip);
    auto run = runImport(store, session, testsupport::generatedRows(3));

    CHECK(run.state == ImportState::Complete);
    CHECK(session.counters().created == 2);
    CHECK(session.errors() == std::vector<std::string>{"Row 2: insert rejected: Item 2"});
}

// =============================================================================
// Transactions
// =============================================================================

TEST_CASE("Commit failure keeps earlier chunks and stops the import", "[BatchCommitCoordinator][transaction]") {
    testsupport::TempDatabase tempDb;
    testsupport::FaultyStore store(std::make_unique<SqliteCatalogStore>(tempDb.path()));
    // Chunk 1 commits at row 10 and at its end; chunk 2's row-20 commit fails
    store.failOnCommit(3);

    ImportSession session("ch_test", 25, ResolutionPolicy::Skip);
    BatchCommitCoordinator coordinator(store, session);
    auto batch = coordinator.validate(testsupport::rawRows(testsupport::generatedRows(25)));

    size_t chunksReported = 0;
    CHECK_THROWS_AS(coordinator.process(batch.rows, [&](const ChunkProgress&) { ++chunksReported; }),
                    TransactionError);

    CHECK(coordinator.state() == ImportState::Error);
    CHECK(chunksReported == 1);

    SqliteCatalogStore reader(tempDb.path());
    auto all = reader.listAll();
    REQUIRE(all.size() == 10);
    CHECK(all.front().name == "Item 1");
    CHECK(all.back().name == "Item 10");
}

TEST_CASE("Intermediate commits every ten writes", "[BatchCommitCoordinator][transaction]") {
    testsupport::TempDatabase tempDb;
    testsupport::FaultyStore store(std::make_unique<SqliteCatalogStore>(tempDb.path()));

    ImportSession session("ch_test", 20, ResolutionPolicy::Skip);
    runImport(store, session, testsupport::generatedRows(20));

    // rows 10 and 20, two chunk ends, save
    CHECK(store.commitCalls() == 5);
}

TEST_CASE("State machine rejects out-of-order stages", "[BatchCommitCoordinator]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    ImportSession session("ch_test", 1, ResolutionPolicy::Skip);
    BatchCommitCoordinator coordinator(store, session);

    CHECK(coordinator.state() == ImportState::Idle);
    CHECK_THROWS_AS(coordinator.save(), std::logic_error);
    CHECK_THROWS_AS(coordinator.process({}), std::logic_error);

    coordinator.validate(testsupport::rawRows(testsupport::generatedRows(1)));
    CHECK(coordinator.state() == ImportState::Validating);
    CHECK_THROWS_AS(coordinator.complete(), std::logic_error);

    coordinator.fail();
    CHECK(coordinator.state() == ImportState::Error);
    CHECK_THROWS_AS(coordinator.validate({}), std::logic_error);
}

TEST_CASE("fail discards uncommitted writes", "[BatchCommitCoordinator][transaction]") {
    testsupport::TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());
    ImportSession session("ch_test", 1, ResolutionPolicy::Skip);
    BatchCommitCoordinator coordinator(store, session);

    auto batch = coordinator.validate(testsupport::rawRows(testsupport::generatedRows(1)));
    auto result = coordinator.processRow(batch.rows[0]);
    CHECK(std::get<RowOutcome>(result) == RowOutcome::Created);
    CHECK(store.inTransaction());

    coordinator.fail();
    CHECK_FALSE(store.inTransaction());
    CHECK(store.listAll().empty());
}
