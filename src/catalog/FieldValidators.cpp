#include "catalog/FieldValidators.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace inventory {
namespace catalog {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

std::string normalizeName(const std::string& name) {
    std::string result = trim(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool validateName(const std::string& name) {
    return !trim(name).empty();
}

bool validateDescription(const std::string& description) {
    return !trim(description).empty();
}

bool validatePrice(double price) {
    return std::isfinite(price) && price >= 0.0;
}

bool validateQuantity(int64_t quantity) {
    return quantity >= 0;
}

std::optional<std::string> firstValidationError(const std::string& name,
                                                const std::string& description,
                                                double price,
                                                int64_t quantity) {
    if (!validateName(name)) return "Name must not be empty";
    if (!validatePrice(price)) return "Price must be zero or greater";
    if (!validateQuantity(quantity)) return "Quantity must be zero or greater";
    if (!validateDescription(description)) return "Description must not be empty";
    return std::nullopt;
}

} // namespace catalog
} // namespace inventory
