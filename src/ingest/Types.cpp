#include "ingest/Types.hpp"

namespace inventory {
namespace ingest {

std::string toString(DuplicateStatus status) {
    switch (status) {
        case DuplicateStatus::New: return "new";
        case DuplicateStatus::DuplicateInBatch: return "duplicate_in_batch";
        case DuplicateStatus::DuplicateInCatalog: return "duplicate_in_catalog";
    }
    return "unknown";
}

std::string toString(ResolutionPolicy policy) {
    switch (policy) {
        case ResolutionPolicy::Skip: return "skip";
        case ResolutionPolicy::Update: return "update";
        case ResolutionPolicy::CreateNew: return "create_new";
    }
    return "unknown";
}

std::optional<ResolutionPolicy> parseResolutionPolicy(const std::string& value) {
    if (value == "skip") return ResolutionPolicy::Skip;
    if (value == "update") return ResolutionPolicy::Update;
    if (value == "create_new") return ResolutionPolicy::CreateNew;
    return std::nullopt;
}

} // namespace ingest
} // namespace inventory
