#pragma once

#include "catalog/CatalogStore.hpp"
#include "ingest/DuplicateClassifier.hpp"
#include "ingest/ImportSession.hpp"
#include "ingest/Types.hpp"
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace inventory {
namespace ingest {

/**
 * idle -> validating -> processing -> saving -> complete,
 * with error reachable from every non-terminal state
 */
enum class ImportState {
    Idle,
    Validating,
    Processing,
    Saving,
    Complete,
    Error
};

std::string toString(ImportState state);

enum class RowOutcome {
    Created,
    Updated,
    Skipped
};

/**
 * A rejected row. `reason` is a short category such as "empty name" or the
 * text of a failed store operation.
 */
struct RowError {
    size_t ordinal = 0;
    std::string reason;

    std::string message() const {
        return "Row " + std::to_string(ordinal) + ": " + reason;
    }
};

using RowResult = std::variant<RowOutcome, RowError>;

/**
 * Output of the validating stage
 */
struct ValidatedBatch {
    std::vector<NormalizedRow> rows;
    std::vector<Classification> classifications;
    ClassificationSummary summary;
};

/**
 * Reported after each committed chunk
 */
struct ChunkProgress {
    size_t chunksDone = 0;
    size_t chunksTotal = 0;
    size_t rowsDone = 0;
    size_t totalRows = 0;
};

using ChunkCallback = std::function<void(const ChunkProgress&)>;

/**
 * Drives one import against a store: validates, then writes rows in
 * fixed-size chunks under the session's resolution policy, committing each
 * chunk as one transaction.
 *
 * Row-level problems are recorded in the session and never stop the run.
 * A failed commit rolls back the current chunk, moves to Error and rethrows
 * the catalog::TransactionError; earlier chunks stay committed.
 */
class BatchCommitCoordinator {
public:
    /// Written rows between intermediate commits inside a chunk
    static constexpr size_t kCommitInterval = 10;

    BatchCommitCoordinator(catalog::CatalogStore& store, ImportSession& session);

    ImportState state() const { return m_state; }

    /**
     * idle -> validating: normalize and classify against a catalog snapshot
     */
    ValidatedBatch validate(const std::vector<RawRow>& rows);

    /**
     * validating -> processing: every chunk in order, onChunk after each
     * successful chunk commit
     */
    void process(const std::vector<NormalizedRow>& rows, const ChunkCallback& onChunk = {});

    /**
     * processing -> saving: flush anything still pending
     */
    void save();

    /**
     * saving -> complete
     */
    void complete();

    /**
     * Any non-terminal state -> error; discards uncommitted writes
     */
    void fail();

    /**
     * Validate one row and apply the resolution policy. Updates the session
     * counters; does not commit.
     */
    RowResult processRow(const NormalizedRow& row);

private:
    void transition(ImportState to);
    void commitPending(const char* reason);

    catalog::CatalogStore& m_store;
    ImportSession& m_session;
    ImportState m_state = ImportState::Idle;
};

} // namespace ingest
} // namespace inventory
