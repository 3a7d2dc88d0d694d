#pragma once

#include "catalog/CatalogStore.hpp"
#include <functional>
#include <memory>
#include <string>
#include <pqxx/pqxx>

namespace inventory {
namespace catalog {

/**
 * @brief PostgreSQL-backed catalog
 *
 * Holds one connection. The first write opens a pqxx::work that lives until
 * commit() or rollback(). Each write runs under its own savepoint, so a
 * failed row leaves the transaction usable. Reads go through that
 * transaction while it is open so they see pending writes, and through a
 * nontransaction otherwise.
 */
class PostgresCatalogStore : public CatalogStore {
public:
    /**
     * @brief Connects and creates the products table if needed
     * @param connectionString Format: "host=localhost port=5432 dbname=mydb user=user password=pass"
     * @throws StoreError if the connection cannot be established
     */
    explicit PostgresCatalogStore(const std::string& connectionString);
    ~PostgresCatalogStore() override;

    PostgresCatalogStore(const PostgresCatalogStore&) = delete;
    PostgresCatalogStore& operator=(const PostgresCatalogStore&) = delete;

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

    /**
     * @brief Checks that the connection is still usable
     */
    bool isConnected() const;

    /**
     * @brief Builds a libpq connection string from "@/path/to/file" (one
     * parameter per line, '#' comments) or returns the argument unchanged
     * @throws std::invalid_argument if the file cannot be opened
     */
    static std::string resolveConnectionString(const std::string& value);

    /**
     * @brief Factory opening a new connection on every call
     */
    static CatalogStoreFactory factory(const std::string& connectionString);

private:
    /**
     * @brief Opens the write transaction if none is open
     */
    pqxx::work& writer();

    /**
     * @brief Runs a read inside the open transaction, or a nontransaction
     */
    pqxx::result read(const std::string& sql, const std::function<pqxx::result(pqxx::transaction_base&)>& query);

    /**
     * @brief Runs one write statement under a savepoint of the write transaction
     * @throws StoreError on SQL errors; earlier pending writes are kept
     */
    pqxx::result write(const std::string& what,
                       const std::function<pqxx::result(pqxx::transaction_base&)>& statement);

    void createTables();

    std::unique_ptr<pqxx::connection> m_connection;
    std::unique_ptr<pqxx::work> m_txn;
};

} // namespace catalog
} // namespace inventory
