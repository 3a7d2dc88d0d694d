#pragma once

#include "catalog/CatalogStore.hpp"
#include "ingest/SheetReader.hpp"
#include "server/Channel.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace testsupport {

using json = nlohmann::json;

// Helper to create a temporary database file
class TempDatabase {
public:
    TempDatabase() : m_path("/tmp/test_inventory_" +
                            std::to_string(std::rand()) + ".db") {}

    ~TempDatabase() {
        std::filesystem::remove(m_path);
        std::filesystem::remove(m_path + "-journal");
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

inline json productRow(const json& name, const json& description, const json& price, const json& quantity) {
    return json{{"name", name}, {"description", description}, {"price", price}, {"quantity", quantity}};
}

inline std::vector<inventory::ingest::RawRow> rawRows(const json& rows) {
    return inventory::ingest::SheetReader::fromRows("test", rows).rows;
}

/**
 * `count` valid rows named <prefix>1 .. <prefix>count
 */
inline json generatedRows(size_t count, const std::string& prefix = "Item ") {
    json rows = json::array();
    for (size_t i = 1; i <= count; ++i) {
        rows.push_back(productRow(prefix + std::to_string(i), "Generated", 1.0 * i, static_cast<int64_t>(i)));
    }
    return rows;
}

/**
 * In-memory channel recording every message sent to it
 */
class RecordingChannel : public inventory::server::Channel {
public:
    explicit RecordingChannel(std::string id, bool failHandshake = false)
        : m_id(std::move(id)), m_failHandshake(failHandshake) {}

    const std::string& id() const override { return m_id; }

    void accept() override {
        if (m_failHandshake) {
            throw std::runtime_error("handshake refused");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
    }

    bool send(std::string text) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) return false;
        m_messages.push_back(json::parse(text));
        return true;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_open;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = false;
    }

    std::vector<json> messages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages;
    }

    std::vector<json> messagesOfType(const std::string& type) const {
        std::vector<json> result;
        for (const auto& m : messages()) {
            if (m.value("type", "") == type) result.push_back(m);
        }
        return result;
    }

private:
    std::string m_id;
    bool m_failHandshake;
    bool m_open = false;
    std::vector<json> m_messages;
    mutable std::mutex m_mutex;
};

/**
 * Store decorator with injectable failures: the Nth commit() call throws
 * TransactionError (after rolling back), and inserts of one name throw
 * StoreError
 */
class FaultyStore : public inventory::catalog::CatalogStore {
public:
    explicit FaultyStore(inventory::catalog::CatalogStorePtr inner) : m_inner(std::move(inner)) {}

    void failOnCommit(size_t n) { m_failOnCommit = n; }
    void failInsertOf(const std::string& name) { m_failInsertName = name; }
    size_t commitCalls() const { return m_commitCalls; }

    std::optional<inventory::catalog::Product> findByNameCi(const std::string& name) override {
        return m_inner->findByNameCi(name);
    }

    inventory::catalog::Product insert(const inventory::catalog::Product& product) override {
        if (!m_failInsertName.empty() && product.name == m_failInsertName) {
            throw inventory::catalog::StoreError("insert rejected: " + product.name);
        }
        return m_inner->insert(product);
    }

    void update(const inventory::catalog::Product& product) override { m_inner->update(product); }

    void commit() override {
        ++m_commitCalls;
        if (m_commitCalls == m_failOnCommit) {
            m_inner->rollback();
            throw inventory::catalog::TransactionError("Commit failed: disk I/O error");
        }
        m_inner->commit();
    }

    void rollback() override { m_inner->rollback(); }

    std::optional<inventory::catalog::Product> findById(int64_t id) override { return m_inner->findById(id); }
    std::vector<inventory::catalog::Product> listAll() override { return m_inner->listAll(); }
    std::vector<inventory::catalog::ProductName> listNames() override { return m_inner->listNames(); }
    bool remove(int64_t id) override { return m_inner->remove(id); }
    std::vector<inventory::catalog::Product> filterByMinPrice(double minPrice) override {
        return m_inner->filterByMinPrice(minPrice);
    }
    std::vector<inventory::catalog::Product> lowStock(int64_t threshold) override {
        return m_inner->lowStock(threshold);
    }
    std::vector<inventory::catalog::Product> highStock(size_t limit) override {
        return m_inner->highStock(limit);
    }

private:
    inventory::catalog::CatalogStorePtr m_inner;
    size_t m_failOnCommit = 0;
    size_t m_commitCalls = 0;
    std::string m_failInsertName;
};

} // namespace testsupport
