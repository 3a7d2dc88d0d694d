#include "catalog/PostgresCatalogStore.hpp"
#include "server/Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace inventory {
namespace catalog {

namespace {

constexpr const char* kSelectColumns = "SELECT id, name, description, price, quantity FROM products";

Product rowToProduct(const pqxx::row& row) {
    Product p;
    p.id = row[0].as<int64_t>();
    p.name = row[1].as<std::string>();
    p.description = row[2].as<std::string>();
    p.price = row[3].as<double>();
    p.quantity = row[4].as<int64_t>();
    return p;
}

std::vector<Product> resultToProducts(const pqxx::result& result) {
    std::vector<Product> products;
    products.reserve(static_cast<size_t>(result.size()));
    for (const auto& row : result) {
        products.push_back(rowToProduct(row));
    }
    return products;
}

} // anonymous namespace

PostgresCatalogStore::PostgresCatalogStore(const std::string& connectionString) {
    try {
        m_connection = std::make_unique<pqxx::connection>(connectionString);
    } catch (const std::exception& e) {
        LOG_ERROR("PostgresCatalogStore: connection failed: " + std::string(e.what()));
        throw StoreError("Failed to open PostgreSQL connection: " + std::string(e.what()));
    }

    if (!m_connection->is_open()) {
        throw StoreError("Failed to open PostgreSQL connection");
    }

    LOG_DEBUG("PostgresCatalogStore: connection established");
    createTables();
}

PostgresCatalogStore::~PostgresCatalogStore() {
    if (m_txn) {
        LOG_DEBUG("PostgresCatalogStore: discarding uncommitted writes");
        m_txn.reset();  // pqxx aborts on destruction
    }
}

void PostgresCatalogStore::createTables() {
    try {
        pqxx::work txn(*m_connection);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS products (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL,
                description TEXT NOT NULL,
                price DOUBLE PRECISION NOT NULL,
                quantity BIGINT NOT NULL
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_products_name_ci ON products (lower(btrim(name)))");
        txn.commit();
    } catch (const pqxx::sql_error& e) {
        LOG_ERROR("PostgresCatalogStore: SQL error: " + std::string(e.what()));
        throw StoreError("SQL error: " + std::string(e.what()));
    }
}

pqxx::work& PostgresCatalogStore::writer() {
    if (!m_txn) {
        m_txn = std::make_unique<pqxx::work>(*m_connection);
    }
    return *m_txn;
}

pqxx::result PostgresCatalogStore::read(
    const std::string& sql,
    const std::function<pqxx::result(pqxx::transaction_base&)>& query)
{
    LOG_DEBUG("PostgresCatalogStore: executing query:\n" + sql);
    try {
        if (m_txn) {
            return query(*m_txn);
        }
        pqxx::nontransaction ntx(*m_connection);
        return query(ntx);
    } catch (const pqxx::sql_error& e) {
        LOG_ERROR("PostgresCatalogStore: SQL error: " + std::string(e.what()));
        throw StoreError("SQL error: " + std::string(e.what()));
    }
}

std::optional<Product> PostgresCatalogStore::findByNameCi(const std::string& name) {
    const std::string sql = std::string(kSelectColumns) +
        " WHERE lower(btrim(name)) = lower(btrim($1)) ORDER BY id LIMIT 1";
    auto result = read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec_params(sql, name);
    });
    if (result.empty()) {
        return std::nullopt;
    }
    return rowToProduct(result[0]);
}

pqxx::result PostgresCatalogStore::write(
    const std::string& what,
    const std::function<pqxx::result(pqxx::transaction_base&)>& statement)
{
    try {
        // Savepoint per statement: a failed write undoes only itself and
        // leaves the surrounding transaction usable
        pqxx::subtransaction savepoint(writer(), "row_write");
        auto result = statement(savepoint);
        savepoint.commit();
        return result;
    } catch (const pqxx::sql_error& e) {
        LOG_ERROR("PostgresCatalogStore: " + what + " failed: " + std::string(e.what()));
        throw StoreError("SQL error: " + std::string(e.what()));
    }
}

Product PostgresCatalogStore::insert(const Product& product) {
    auto result = write("insert", [&](pqxx::transaction_base& tx) {
        return tx.exec_params(
            "INSERT INTO products (name, description, price, quantity) "
            "VALUES ($1, $2, $3, $4) RETURNING id",
            product.name, product.description, product.price, product.quantity);
    });

    Product inserted = product;
    inserted.id = result[0][0].as<int64_t>();
    return inserted;
}

void PostgresCatalogStore::update(const Product& product) {
    if (!product.id) {
        throw StoreError("Cannot update a product without id: " + product.name);
    }

    auto result = write("update", [&](pqxx::transaction_base& tx) {
        return tx.exec_params(
            "UPDATE products SET name = $1, description = $2, price = $3, quantity = $4 "
            "WHERE id = $5",
            product.name, product.description, product.price, product.quantity, *product.id);
    });

    if (result.affected_rows() == 0) {
        throw StoreError("Product not found: " + std::to_string(*product.id));
    }
}

void PostgresCatalogStore::commit() {
    if (!m_txn) return;

    auto txn = std::move(m_txn);
    try {
        txn->commit();
    } catch (const std::exception& e) {
        LOG_ERROR("PostgresCatalogStore: commit failed: " + std::string(e.what()));
        throw TransactionError("Commit failed: " + std::string(e.what()));
    }
}

void PostgresCatalogStore::rollback() {
    if (!m_txn) return;

    auto txn = std::move(m_txn);
    txn->abort();
}

std::optional<Product> PostgresCatalogStore::findById(int64_t id) {
    const std::string sql = std::string(kSelectColumns) + " WHERE id = $1";
    auto result = read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec_params(sql, id);
    });
    if (result.empty()) {
        return std::nullopt;
    }
    return rowToProduct(result[0]);
}

std::vector<Product> PostgresCatalogStore::listAll() {
    const std::string sql = std::string(kSelectColumns) + " ORDER BY id";
    return resultToProducts(read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec(sql);
    }));
}

std::vector<ProductName> PostgresCatalogStore::listNames() {
    const std::string sql = "SELECT id, name FROM products ORDER BY id";
    auto result = read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec(sql);
    });

    std::vector<ProductName> names;
    names.reserve(static_cast<size_t>(result.size()));
    for (const auto& row : result) {
        names.emplace_back(row[0].as<int64_t>(), row[1].as<std::string>());
    }
    return names;
}

bool PostgresCatalogStore::remove(int64_t id) {
    auto result = write("delete", [&](pqxx::transaction_base& tx) {
        return tx.exec_params("DELETE FROM products WHERE id = $1", id);
    });
    return result.affected_rows() > 0;
}

std::vector<Product> PostgresCatalogStore::filterByMinPrice(double minPrice) {
    const std::string sql = std::string(kSelectColumns) + " WHERE price >= $1 ORDER BY id";
    return resultToProducts(read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec_params(sql, minPrice);
    }));
}

std::vector<Product> PostgresCatalogStore::lowStock(int64_t threshold) {
    const std::string sql = std::string(kSelectColumns) +
        " WHERE quantity < $1 ORDER BY quantity ASC, id ASC";
    return resultToProducts(read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec_params(sql, threshold);
    }));
}

std::vector<Product> PostgresCatalogStore::highStock(size_t limit) {
    const std::string sql = std::string(kSelectColumns) +
        " ORDER BY quantity DESC, id ASC LIMIT $1";
    return resultToProducts(read(sql, [&](pqxx::transaction_base& tx) {
        return tx.exec_params(sql, static_cast<int64_t>(limit));
    }));
}

bool PostgresCatalogStore::isConnected() const {
    return m_connection && m_connection->is_open();
}

std::string PostgresCatalogStore::resolveConnectionString(const std::string& value) {
    if (value.empty() || value[0] != '@') {
        return value;
    }

    std::string configPath = value.substr(1);
    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        throw std::invalid_argument("Cannot open PostgreSQL config file: " + configPath);
    }

    std::string connString;
    std::string line;
    while (std::getline(configFile, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        if (!connString.empty()) connString += " ";
        connString += line;
    }
    return connString;
}

CatalogStoreFactory PostgresCatalogStore::factory(const std::string& connectionString) {
    return [connectionString]() -> CatalogStorePtr {
        return std::make_unique<PostgresCatalogStore>(connectionString);
    };
}

} // namespace catalog
} // namespace inventory
