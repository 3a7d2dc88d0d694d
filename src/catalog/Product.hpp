#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace inventory {
namespace catalog {

/**
 * One catalog entry.
 *
 * The id is assigned by the store on insert and stays empty before that.
 * Name matching inside the catalog is case-insensitive, but nothing at the
 * storage level enforces uniqueness.
 */
struct Product {
    std::optional<int64_t> id;
    std::string name;
    std::string description;
    double price = 0.0;
    int64_t quantity = 0;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["id"] = id ? nlohmann::json(*id) : nlohmann::json(nullptr);
        j["name"] = name;
        j["description"] = description;
        j["price"] = price;
        j["quantity"] = quantity;
        return j;
    }
};

/// (id, name) pair used to snapshot the catalog before a classification pass
using ProductName = std::pair<int64_t, std::string>;

} // namespace catalog
} // namespace inventory
