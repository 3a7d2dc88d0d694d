#include "catalog/SqliteCatalogStore.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace inventory {
namespace catalog {

namespace {

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw StoreError("Failed to prepare statement: " +
                             std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindDouble(int index, double value) {
        sqlite3_bind_double(m_stmt, index, value);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw StoreError("Step failed: " +
                         std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    double getDouble(int col) {
        return sqlite3_column_double(m_stmt, col);
    }

private:
    sqlite3_stmt* m_stmt;
};

constexpr const char* kSelectColumns = "SELECT id, name, description, price, quantity FROM products";

Product readProduct(Statement& stmt) {
    Product p;
    p.id = stmt.getInt64(0);
    p.name = stmt.getText(1);
    p.description = stmt.getText(2);
    p.price = stmt.getDouble(3);
    p.quantity = stmt.getInt64(4);
    return p;
}

std::vector<Product> readAll(Statement& stmt) {
    std::vector<Product> products;
    while (stmt.step()) {
        products.push_back(readProduct(stmt));
    }
    return products;
}

} // anonymous namespace

// =============================================================================
// SqliteCatalogStore::Impl
// =============================================================================

class SqliteCatalogStore::Impl {
public:
    Impl(const std::string& dbPath, int busyTimeoutMs) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw StoreError("Failed to open database: " + error);
        }

        sqlite3_busy_timeout(m_db, busyTimeoutMs);
        try {
            createTables();
        } catch (const StoreError&) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw;
        }
    }

    ~Impl() {
        if (m_db) {
            if (m_inTransaction) {
                sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            }
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw StoreError("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS products (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                description TEXT NOT NULL,
                price REAL NOT NULL,
                quantity INTEGER NOT NULL
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_products_name_ci ON products(lower(trim(name)))");
    }

    // Writers take the lock up front so a concurrent session waits on BEGIN
    // instead of failing on a read-to-write upgrade.
    void ensureTransaction() {
        if (!m_inTransaction) {
            exec("BEGIN IMMEDIATE");
            m_inTransaction = true;
        }
    }

    std::optional<Product> findByNameCi(const std::string& name) {
        Statement stmt(m_db, std::string(kSelectColumns) +
            " WHERE lower(trim(name)) = lower(trim(?)) ORDER BY id LIMIT 1");
        stmt.bindText(1, name);
        if (stmt.step()) {
            return readProduct(stmt);
        }
        return std::nullopt;
    }

    Product insert(const Product& product) {
        ensureTransaction();

        Statement stmt(m_db,
            "INSERT INTO products (name, description, price, quantity) VALUES (?, ?, ?, ?)");
        stmt.bindText(1, product.name);
        stmt.bindText(2, product.description);
        stmt.bindDouble(3, product.price);
        stmt.bindInt64(4, product.quantity);
        stmt.step();

        Product inserted = product;
        inserted.id = sqlite3_last_insert_rowid(m_db);
        return inserted;
    }

    void update(const Product& product) {
        if (!product.id) {
            throw StoreError("Cannot update a product without id: " + product.name);
        }
        ensureTransaction();

        Statement stmt(m_db,
            "UPDATE products SET name = ?, description = ?, price = ?, quantity = ? WHERE id = ?");
        stmt.bindText(1, product.name);
        stmt.bindText(2, product.description);
        stmt.bindDouble(3, product.price);
        stmt.bindInt64(4, product.quantity);
        stmt.bindInt64(5, *product.id);
        stmt.step();

        if (sqlite3_changes(m_db) == 0) {
            throw StoreError("Product not found: " + std::to_string(*product.id));
        }
    }

    void commit() {
        if (!m_inTransaction) return;

        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            // A failed COMMIT may leave the transaction open (SQLITE_BUSY)
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            m_inTransaction = false;
            throw TransactionError("Commit failed: " + error);
        }
        m_inTransaction = false;
    }

    void rollback() {
        if (!m_inTransaction) return;
        m_inTransaction = false;
        exec("ROLLBACK");
    }

    std::optional<Product> findById(int64_t id) {
        Statement stmt(m_db, std::string(kSelectColumns) + " WHERE id = ?");
        stmt.bindInt64(1, id);
        if (stmt.step()) {
            return readProduct(stmt);
        }
        return std::nullopt;
    }

    std::vector<Product> listAll() {
        Statement stmt(m_db, std::string(kSelectColumns) + " ORDER BY id");
        return readAll(stmt);
    }

    std::vector<ProductName> listNames() {
        Statement stmt(m_db, "SELECT id, name FROM products ORDER BY id");
        std::vector<ProductName> names;
        while (stmt.step()) {
            names.emplace_back(stmt.getInt64(0), stmt.getText(1));
        }
        return names;
    }

    bool remove(int64_t id) {
        ensureTransaction();
        Statement stmt(m_db, "DELETE FROM products WHERE id = ?");
        stmt.bindInt64(1, id);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    std::vector<Product> filterByMinPrice(double minPrice) {
        Statement stmt(m_db, std::string(kSelectColumns) + " WHERE price >= ? ORDER BY id");
        stmt.bindDouble(1, minPrice);
        return readAll(stmt);
    }

    std::vector<Product> lowStock(int64_t threshold) {
        Statement stmt(m_db, std::string(kSelectColumns) +
            " WHERE quantity < ? ORDER BY quantity ASC, id ASC");
        stmt.bindInt64(1, threshold);
        return readAll(stmt);
    }

    std::vector<Product> highStock(size_t limit) {
        Statement stmt(m_db, std::string(kSelectColumns) +
            " ORDER BY quantity DESC, id ASC LIMIT ?");
        stmt.bindInt64(1, static_cast<int64_t>(limit));
        return readAll(stmt);
    }

    std::string m_dbPath;
    sqlite3* m_db;
    bool m_inTransaction = false;
};

// =============================================================================
// SqliteCatalogStore
// =============================================================================

SqliteCatalogStore::SqliteCatalogStore(const std::string& dbPath, int busyTimeoutMs)
    : m_impl(std::make_unique<Impl>(dbPath, busyTimeoutMs)) {}

SqliteCatalogStore::~SqliteCatalogStore() = default;

std::optional<Product> SqliteCatalogStore::findByNameCi(const std::string& name) {
    return m_impl->findByNameCi(name);
}

Product SqliteCatalogStore::insert(const Product& product) {
    return m_impl->insert(product);
}

void SqliteCatalogStore::update(const Product& product) {
    m_impl->update(product);
}

void SqliteCatalogStore::commit() {
    m_impl->commit();
}

void SqliteCatalogStore::rollback() {
    m_impl->rollback();
}

std::optional<Product> SqliteCatalogStore::findById(int64_t id) {
    return m_impl->findById(id);
}

std::vector<Product> SqliteCatalogStore::listAll() {
    return m_impl->listAll();
}

std::vector<ProductName> SqliteCatalogStore::listNames() {
    return m_impl->listNames();
}

bool SqliteCatalogStore::remove(int64_t id) {
    return m_impl->remove(id);
}

std::vector<Product> SqliteCatalogStore::filterByMinPrice(double minPrice) {
    return m_impl->filterByMinPrice(minPrice);
}

std::vector<Product> SqliteCatalogStore::lowStock(int64_t threshold) {
    return m_impl->lowStock(threshold);
}

std::vector<Product> SqliteCatalogStore::highStock(size_t limit) {
    return m_impl->highStock(limit);
}

bool SqliteCatalogStore::inTransaction() const {
    return m_impl->m_inTransaction;
}

const std::string& SqliteCatalogStore::getDbPath() const {
    return m_impl->m_dbPath;
}

CatalogStoreFactory SqliteCatalogStore::factory(const std::string& dbPath) {
    return [dbPath]() -> CatalogStorePtr {
        return std::make_unique<SqliteCatalogStore>(dbPath);
    };
}

} // namespace catalog
} // namespace inventory
