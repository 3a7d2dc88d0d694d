#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace inventory {
namespace catalog {

// Field predicates shared by the HTTP product endpoints and the import
// commit loop.

bool validateName(const std::string& name);
bool validateDescription(const std::string& description);
bool validatePrice(double price);
bool validateQuantity(int64_t quantity);

/**
 * First failing rule for a complete product, as a user-facing message.
 * Returns nullopt when every field is valid.
 */
std::optional<std::string> firstValidationError(const std::string& name,
                                                const std::string& description,
                                                double price,
                                                int64_t quantity);

/**
 * Strip leading and trailing ASCII whitespace
 */
std::string trim(const std::string& s);

/**
 * Trimmed, ASCII lower-cased form used for case-insensitive name matching
 */
std::string normalizeName(const std::string& name);

} // namespace catalog
} // namespace inventory
