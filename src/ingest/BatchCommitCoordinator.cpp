#include "ingest/BatchCommitCoordinator.hpp"
#include "ingest/TabularNormalizer.hpp"
#include "catalog/FieldValidators.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <algorithm>
#include <stdexcept>

namespace inventory {
namespace ingest {

namespace {

bool isAllowed(ImportState from, ImportState to) {
    if (to == ImportState::Error) {
        return from != ImportState::Complete && from != ImportState::Error;
    }
    switch (from) {
        case ImportState::Idle: return to == ImportState::Validating;
        case ImportState::Validating: return to == ImportState::Processing;
        case ImportState::Processing: return to == ImportState::Saving;
        case ImportState::Saving: return to == ImportState::Complete;
        default: return false;
    }
}

std::string priceReason(FieldIssue issue) {
    return issue == FieldIssue::None ? "negative price" : "invalid price";
}

std::string quantityReason(FieldIssue issue) {
    return issue == FieldIssue::None ? "negative quantity" : "invalid quantity";
}

} // anonymous namespace

std::string toString(ImportState state) {
    switch (state) {
        case ImportState::Idle: return "idle";
        case ImportState::Validating: return "validating";
        case ImportState::Processing: return "processing";
        case ImportState::Saving: return "saving";
        case ImportState::Complete: return "complete";
        case ImportState::Error: return "error";
    }
    return "unknown";
}

BatchCommitCoordinator::BatchCommitCoordinator(catalog::CatalogStore& store, ImportSession& session)
    : m_store(store)
    , m_session(session)
{
}

void BatchCommitCoordinator::transition(ImportState to) {
    if (!isAllowed(m_state, to)) {
        throw std::logic_error("Invalid import transition: " + toString(m_state) +
                               " -> " + toString(to));
    }
    LOG_DEBUG("[" + m_session.id() + "] " + toString(m_state) + " -> " + toString(to));
    m_state = to;
}

ValidatedBatch BatchCommitCoordinator::validate(const std::vector<RawRow>& rows) {
    transition(ImportState::Validating);

    ValidatedBatch batch;
    batch.rows = TabularNormalizer::normalize(rows);

    auto classifier = DuplicateClassifier::fromStore(m_store);
    batch.classifications = classifier.classify(batch.rows);
    batch.summary = DuplicateClassifier::summarize(batch.classifications);

    LOG_INFO("[" + m_session.id() + "] " + std::to_string(batch.rows.size()) + " rows: " +
             std::to_string(batch.summary.newRows) + " new, " +
             std::to_string(batch.summary.duplicatesInCatalog) + " already in catalog, " +
             std::to_string(batch.summary.duplicatesInBatch) + " repeated in batch");
    return batch;
}

RowResult BatchCommitCoordinator::processRow(const NormalizedRow& row) {
    if (!catalog::validateName(row.name)) {
        return RowError{row.ordinal, "empty name"};
    }
    if (!catalog::validateDescription(row.description)) {
        return RowError{row.ordinal, "empty description"};
    }
    if (!row.price.ok() || !catalog::validatePrice(*row.price.value)) {
        return RowError{row.ordinal, priceReason(row.price.issue)};
    }
    if (!row.quantity.ok() || !catalog::validateQuantity(*row.quantity.value)) {
        return RowError{row.ordinal, quantityReason(row.quantity.issue)};
    }

    catalog::Product candidate;
    candidate.name = row.name;
    candidate.description = row.description;
    candidate.price = *row.price.value;
    candidate.quantity = *row.quantity.value;

    auto& counters = m_session.counters();
    try {
        // Fresh lookup: the classification snapshot may be stale by now
        auto existing = m_store.findByNameCi(row.name);

        if (!existing) {
            m_store.insert(candidate);
            ++counters.created;
            LOG_DEBUG("[" + m_session.id() + "] created: " + row.name);
            return RowOutcome::Created;
        }

        switch (m_session.policy()) {
            case ResolutionPolicy::Skip:
                ++counters.skipped;
                LOG_DEBUG("[" + m_session.id() + "] skipped duplicate: " + row.name);
                return RowOutcome::Skipped;

            case ResolutionPolicy::Update:
                existing->description = candidate.description;
                existing->price = candidate.price;
                existing->quantity = candidate.quantity;
                m_store.update(*existing);
                ++counters.updated;
                LOG_DEBUG("[" + m_session.id() + "] updated: " + row.name);
                return RowOutcome::Updated;

            case ResolutionPolicy::CreateNew:
                m_store.insert(candidate);
                ++counters.created;
                LOG_DEBUG("[" + m_session.id() + "] created duplicate as new: " + row.name);
                return RowOutcome::Created;
        }
    } catch (const catalog::TransactionError&) {
        throw;
    } catch (const catalog::StoreError& e) {
        return RowError{row.ordinal, e.what()};
    }

    throw std::logic_error("Unhandled resolution policy");
}

void BatchCommitCoordinator::commitPending(const char* reason) {
    server::ScopedTimer timer("ingest.commitChunk");
    try {
        m_store.commit();
    } catch (const catalog::TransactionError& e) {
        LOG_ERROR("[" + m_session.id() + "] commit failed (" + reason + "): " + e.what());
        fail();
        throw;
    }
}

void BatchCommitCoordinator::process(const std::vector<NormalizedRow>& rows, const ChunkCallback& onChunk) {
    transition(ImportState::Processing);

    const size_t chunkSize = m_session.chunkSize();
    const size_t chunksTotal = (rows.size() + chunkSize - 1) / chunkSize;
    const auto& counters = m_session.counters();

    size_t chunksDone = 0;
    for (size_t begin = 0; begin < rows.size(); begin += chunkSize) {
        const size_t end = std::min(begin + chunkSize, rows.size());

        for (size_t i = begin; i < end; ++i) {
            RowResult result = processRow(rows[i]);

            if (auto* error = std::get_if<RowError>(&result)) {
                LOG_WARN("[" + m_session.id() + "] " + error->message());
                m_session.recordError(error->message());
                continue;
            }

            auto outcome = std::get<RowOutcome>(result);
            if (outcome != RowOutcome::Skipped && counters.written() % kCommitInterval == 0) {
                commitPending("interval");
            }
        }

        commitPending("end of chunk");
        ++chunksDone;

        if (onChunk) {
            onChunk(ChunkProgress{chunksDone, chunksTotal, end, rows.size()});
        }
    }
}

void BatchCommitCoordinator::save() {
    transition(ImportState::Saving);
    commitPending("save");
}

void BatchCommitCoordinator::complete() {
    transition(ImportState::Complete);
    m_session.advanceProgress(100);

    const auto& counters = m_session.counters();
    LOG_INFO("[" + m_session.id() + "] import complete: " +
             std::to_string(counters.created) + " created, " +
             std::to_string(counters.updated) + " updated, " +
             std::to_string(counters.skipped) + " skipped, " +
             std::to_string(m_session.errorCount()) + " errors");
}

void BatchCommitCoordinator::fail() {
    if (m_state == ImportState::Complete || m_state == ImportState::Error) {
        return;
    }
    m_state = ImportState::Error;
    try {
        m_store.rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("[" + m_session.id() + "] rollback failed: " + e.what());
    }
}

} // namespace ingest
} // namespace inventory
