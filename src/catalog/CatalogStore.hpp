#pragma once

#include "catalog/Product.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory {
namespace catalog {

/**
 * A single store operation (lookup, insert, update, delete) failed.
 * Recoverable at row level during an import.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * commit() failed. The pending writes are lost and the import session
 * that issued them must stop.
 */
class TransactionError : public StoreError {
public:
    using StoreError::StoreError;
};

/**
 * Persistent product catalog.
 *
 * Writes implicitly open a transaction that stays open until commit() or
 * rollback(). Reads issued through the same instance see its pending writes.
 * An instance is bound to one connection and is not thread-safe: give each
 * import session or request its own (see CatalogStoreFactory).
 */
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    // === Import contract ===

    /**
     * First product whose trimmed name equals `name` ignoring ASCII case
     */
    virtual std::optional<Product> findByNameCi(const std::string& name) = 0;

    /**
     * Insert a product, returns it with its assigned id
     */
    virtual Product insert(const Product& product) = 0;

    /**
     * Overwrite name, description, price and quantity of product.id
     */
    virtual void update(const Product& product) = 0;

    /**
     * Make every pending write durable, atomically.
     * Throws TransactionError on failure (pending writes are discarded).
     */
    virtual void commit() = 0;

    /**
     * Discard every pending write. No-op without an open transaction.
     */
    virtual void rollback() = 0;

    // === Plain catalog access ===

    virtual std::optional<Product> findById(int64_t id) = 0;
    virtual std::vector<Product> listAll() = 0;
    virtual std::vector<ProductName> listNames() = 0;

    /**
     * Delete by id, returns false if no such product
     */
    virtual bool remove(int64_t id) = 0;

    virtual std::vector<Product> filterByMinPrice(double minPrice) = 0;

    /**
     * Products with quantity < threshold, lowest quantity first
     */
    virtual std::vector<Product> lowStock(int64_t threshold) = 0;

    /**
     * At most `limit` products, highest quantity first
     */
    virtual std::vector<Product> highStock(size_t limit) = 0;
};

using CatalogStorePtr = std::unique_ptr<CatalogStore>;

/// Opens a fresh store (own connection, own transaction scope)
using CatalogStoreFactory = std::function<CatalogStorePtr()>;

} // namespace catalog
} // namespace inventory
