#include "server/ImportController.hpp"
#include "ingest/ImportSession.hpp"
#include "ingest/ProgressEvent.hpp"
#include "ingest/SheetReader.hpp"
#include "server/Logger.hpp"
#include <optional>
#include <stdexcept>
#include <thread>

namespace inventory {
namespace server {

StartCommand StartCommand::fromJson(const json& message) {
    StartCommand command;

    auto rowsIt = message.find("rows");
    if (rowsIt == message.end() || !rowsIt->is_array()) {
        throw std::invalid_argument("Field 'rows' must be an array");
    }
    command.rows = ingest::SheetReader::fromRows("upload", *rowsIt).rows;

    auto actionIt = message.find("duplicate_action");
    if (actionIt != message.end() && !actionIt->is_null()) {
        if (!actionIt->is_string()) {
            throw std::invalid_argument("Field 'duplicate_action' must be a string");
        }
        auto policy = ingest::parseResolutionPolicy(actionIt->get<std::string>());
        if (!policy) {
            throw std::invalid_argument("Unknown duplicate_action: " + actionIt->get<std::string>());
        }
        command.policy = *policy;
    }

    return command;
}

ImportController::ImportController(ConnectionRegistry& registry,
                                   catalog::CatalogStoreFactory storeFactory,
                                   WorkerExecutor workers,
                                   ImportOptions options)
    : m_registry(registry)
    , m_storeFactory(std::move(storeFactory))
    , m_workers(workers)
    , m_options(options)
{
}

ImportController::ChannelStrand ImportController::strandFor(const std::string& channelId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_strands.find(channelId);
    if (it == m_strands.end()) {
        it = m_strands.emplace(channelId, net::make_strand(m_workers)).first;
    }
    return it->second;
}

void ImportController::onChannelClosed(const std::string& channelId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_strands.erase(channelId);
}

size_t ImportController::activeChannelQueues() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_strands.size();
}

void ImportController::handleMessage(const ChannelPtr& channel, const std::string& text) {
    const std::string channelId = channel->id();
    Logger::instance().logChannel(channelId, "<-", text);

    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        m_registry.emit(channelId, ingest::ProgressEvent::makeError(
            "Invalid JSON: " + std::string(e.what())));
        return;
    }

    if (!message.is_object()) {
        m_registry.emit(channelId, ingest::ProgressEvent::makeError("Expected a JSON object"));
        return;
    }

    std::string action;
    auto actionIt = message.find("action");
    if (actionIt != message.end()) {
        if (!actionIt->is_string()) {
            m_registry.emit(channelId, ingest::ProgressEvent::makeError("Field 'action' must be a string"));
            return;
        }
        action = actionIt->get<std::string>();
    }

    if (action == "ping") {
        m_registry.emit(channelId, ingest::ProgressEvent::makePong());
        return;
    }

    if (action == "start_upload") {
        StartCommand command;
        try {
            command = StartCommand::fromJson(message);
        } catch (const std::invalid_argument& e) {
            m_registry.emit(channelId, ingest::ProgressEvent::makeError(e.what()));
            return;
        }

        // A copy, so the queue outlives onChannelClosed()
        ChannelStrand strand = strandFor(channelId);
        net::post(strand, [this, channelId, command = std::move(command)]() {
            runImport(channelId, command);
        });
        return;
    }

    LOG_WARN("[" + channelId + "] ignoring unknown action: '" + action + "'");
}

void ImportController::pace() const {
    if (m_options.stageDelay.count() > 0) {
        std::this_thread::sleep_for(m_options.stageDelay);
    }
}

void ImportController::emitProgress(const std::string& channelId, ingest::ImportSession& session,
                                    const std::string& step, int percent, const std::string& message,
                                    json data) {
    int progress = session.advanceProgress(percent);
    m_registry.emit(channelId, ingest::ProgressEvent::makeProgress(step, progress, message, std::move(data)));
}

ingest::ImportState ImportController::runImport(const std::string& channelId, const StartCommand& command) {
    const size_t totalRows = command.rows.size();

    if (totalRows == 0) {
        m_registry.emit(channelId, ingest::ProgressEvent::makeError("No rows to import"));
        return ingest::ImportState::Error;
    }

    ingest::ImportSession session(channelId, totalRows, command.policy);
    LOG_INFO("[" + session.id() + "] import started on " + channelId + ": " +
             std::to_string(totalRows) + " rows, policy " + ingest::toString(command.policy));

    catalog::CatalogStorePtr store;
    std::optional<ingest::BatchCommitCoordinator> coordinator;

    try {
        store = m_storeFactory();
        coordinator.emplace(*store, session);

        emitProgress(channelId, session, "start", 0,
                     "Starting import of " + std::to_string(totalRows) + " products");
        pace();

        emitProgress(channelId, session, "validating", 10,
                     "Validating data and detecting duplicates...");
        auto batch = coordinator->validate(command.rows);
        pace();

        coordinator->process(batch.rows, [&](const ingest::ChunkProgress& chunk) {
            int percent = 10 + static_cast<int>(80 * chunk.chunksDone / chunk.chunksTotal);
            emitProgress(channelId, session, "processing", percent,
                         "Processed " + std::to_string(chunk.rowsDone) + " of " +
                         std::to_string(chunk.totalRows) + " rows",
                         session.countersJson());
        });

        coordinator->save();
        emitProgress(channelId, session, "saving", 95, "Saving changes...");
        pace();

        coordinator->complete();
        m_registry.emit(channelId, ingest::ProgressEvent::makeComplete(
            "Import completed successfully", session.summaryJson()));
        return ingest::ImportState::Complete;

    } catch (const std::exception& e) {
        LOG_ERROR("[" + session.id() + "] import failed: " + std::string(e.what()));

        if (coordinator) {
            coordinator->fail();
        }

        m_registry.emit(channelId, ingest::ProgressEvent::makeError("Error: " + std::string(e.what())));
        return ingest::ImportState::Error;
    }
}

} // namespace server
} // namespace inventory
