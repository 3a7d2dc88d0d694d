#include <catch2/catch_test_macros.hpp>
#include "catalog/SqliteCatalogStore.hpp"
#include "TestSupport.hpp"

using namespace inventory::catalog;
using testsupport::TempDatabase;

namespace {

Product makeProduct(const std::string& name, double price, int64_t quantity) {
    return Product{std::nullopt, name, name + " description", price, quantity};
}

} // anonymous namespace

// =============================================================================
// CRUD
// =============================================================================

TEST_CASE("Insert assigns ids and reads back", "[SqliteCatalogStore][CRUD]") {
    TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    auto first = store.insert(makeProduct("Bolt", 0.25, 100));
    auto second = store.insert(makeProduct("Nut", 0.10, 200));
    store.commit();

    REQUIRE(first.id.has_value());
    REQUIRE(second.id.has_value());
    CHECK(*second.id > *first.id);

    auto retrieved = store.findById(*first.id);
    REQUIRE(retrieved.has_value());
    CHECK(retrieved->name == "Bolt");
    CHECK(retrieved->description == "Bolt description");
    CHECK(retrieved->price == 0.25);
    CHECK(retrieved->quantity == 100);

    CHECK_FALSE(store.findById(9999).has_value());
    CHECK(store.listAll().size() == 2);
    CHECK(store.getDbPath() == tempDb.path());
}

TEST_CASE("Update and remove", "[SqliteCatalogStore][CRUD]") {
    TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    auto product = store.insert(makeProduct("Saw", 15.0, 4));
    product.price = 17.5;
    product.quantity = 2;
    store.update(product);
    store.commit();

    CHECK(store.findById(*product.id)->price == 17.5);

    Product ghost = makeProduct("Ghost", 1.0, 1);
    ghost.id = 424242;
    CHECK_THROWS_AS(store.update(ghost), StoreError);
    CHECK_THROWS_AS(store.update(makeProduct("No id", 1.0, 1)), StoreError);
    store.rollback();

    CHECK(store.remove(*product.id));
    CHECK_FALSE(store.remove(*product.id));
    store.commit();
    CHECK(store.listAll().empty());
}

TEST_CASE("Case-insensitive name lookup", "[SqliteCatalogStore][lookup]") {
    TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    auto hammer = store.insert(makeProduct("Claw Hammer", 20.0, 5));
    store.insert(makeProduct("claw hammer", 21.0, 6));
    store.insert(makeProduct("100%_match", 1.0, 1));
    store.commit();

    auto found = store.findByNameCi("  CLAW HAMMER ");
    REQUIRE(found.has_value());
    CHECK(found->id == hammer.id);

    CHECK_FALSE(store.findByNameCi("claw").has_value());
    // No LIKE wildcard semantics
    CHECK_FALSE(store.findByNameCi("100%").has_value());
    CHECK(store.findByNameCi("100%_MATCH").has_value());
}

TEST_CASE("Stock queries", "[SqliteCatalogStore][queries]") {
    TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    store.insert(makeProduct("A", 5.0, 3));
    store.insert(makeProduct("B", 50.0, 30));
    store.insert(makeProduct("C", 15.0, 0));
    store.insert(makeProduct("D", 25.0, 12));
    store.commit();

    auto expensive = store.filterByMinPrice(15.0);
    REQUIRE(expensive.size() == 3);
    CHECK(expensive[0].name == "B");

    auto low = store.lowStock(10);
    REQUIRE(low.size() == 2);
    CHECK(low[0].name == "C");
    CHECK(low[1].name == "A");

    auto high = store.highStock(2);
    REQUIRE(high.size() == 2);
    CHECK(high[0].name == "B");
    CHECK(high[1].name == "D");

    auto names = store.listNames();
    REQUIRE(names.size() == 4);
    CHECK(names[0].second == "A");
}

// =============================================================================
// Transactions
// =============================================================================

TEST_CASE("Pending writes are visible to their own store only", "[SqliteCatalogStore][transaction]") {
    TempDatabase tempDb;
    SqliteCatalogStore writer(tempDb.path());
    SqliteCatalogStore reader(tempDb.path());

    writer.insert(makeProduct("Pending", 1.0, 1));
    CHECK(writer.inTransaction());
    CHECK(writer.findByNameCi("pending").has_value());
    CHECK_FALSE(reader.findByNameCi("pending").has_value());

    writer.commit();
    CHECK_FALSE(writer.inTransaction());
    CHECK(reader.findByNameCi("pending").has_value());
}

TEST_CASE("Rollback discards pending writes", "[SqliteCatalogStore][transaction]") {
    TempDatabase tempDb;
    SqliteCatalogStore store(tempDb.path());

    store.insert(makeProduct("Kept", 1.0, 1));
    store.commit();
    store.insert(makeProduct("Dropped", 1.0, 1));
    store.rollback();

    auto all = store.listAll();
    REQUIRE(all.size() == 1);
    CHECK(all[0].name == "Kept");

    // No open transaction: both are no-ops
    store.rollback();
    store.commit();
}

TEST_CASE("Destroying a store rolls back its open transaction", "[SqliteCatalogStore][transaction]") {
    TempDatabase tempDb;
    {
        SqliteCatalogStore store(tempDb.path());
        store.insert(makeProduct("Abandoned", 1.0, 1));
    }

    SqliteCatalogStore store(tempDb.path());
    CHECK(store.listAll().empty());
}

TEST_CASE("Factory opens independent stores", "[SqliteCatalogStore]") {
    TempDatabase tempDb;
    auto factory = SqliteCatalogStore::factory(tempDb.path());

    auto a = factory();
    auto b = factory();
    CHECK(a.get() != b.get());

    a->insert(makeProduct("Shared", 1.0, 1));
    a->commit();
    CHECK(b->findByNameCi("shared").has_value());
}

TEST_CASE("Unopenable database throws StoreError", "[SqliteCatalogStore]") {
    CHECK_THROWS_AS(SqliteCatalogStore("/nonexistent_dir/sub/catalog.db"), StoreError);
}
