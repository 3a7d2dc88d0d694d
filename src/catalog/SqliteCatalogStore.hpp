#pragma once

#include "catalog/CatalogStore.hpp"
#include <memory>
#include <string>

namespace inventory {
namespace catalog {

/**
 * SQLite-backed catalog.
 *
 * Each instance owns one connection to the database file. Several instances
 * may point at the same file: writers wait on each other through the busy
 * timeout instead of failing immediately.
 *
 * Usage:
 *   SqliteCatalogStore store("./inventory.db");
 *   auto bolt = store.insert({.name = "Bolt", .description = "M6", .price = 1.5, .quantity = 10});
 *   store.commit();
 */
class SqliteCatalogStore : public CatalogStore {
public:
    /**
     * Open or create a SQLite database at the given path and make sure the
     * products table exists
     */
    explicit SqliteCatalogStore(const std::string& dbPath, int busyTimeoutMs = 5000);
    ~SqliteCatalogStore() override;

    // Non-copyable
    SqliteCatalogStore(const SqliteCatalogStore&) = delete;
    SqliteCatalogStore& operator=(const SqliteCatalogStore&) = delete;

    std::optional<Product> findByNameCi(const std::string& name) override;
    Product insert(const Product& product) override;
    void update(const Product& product) override;
    void commit() override;
    void rollback() override;

    std::optional<Product> findById(int64_t id) override;
    std::vector<Product> listAll() override;
    std::vector<ProductName> listNames() override;
    bool remove(int64_t id) override;
    std::vector<Product> filterByMinPrice(double minPrice) override;
    std::vector<Product> lowStock(int64_t threshold) override;
    std::vector<Product> highStock(size_t limit) override;

    bool inTransaction() const;
    const std::string& getDbPath() const;

    /**
     * Factory opening a new connection to dbPath on every call
     */
    static CatalogStoreFactory factory(const std::string& dbPath);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace catalog
} // namespace inventory
