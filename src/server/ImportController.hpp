#pragma once

#include "catalog/CatalogStore.hpp"
#include "ingest/BatchCommitCoordinator.hpp"
#include "ingest/Types.hpp"
#include "server/Channel.hpp"
#include "server/ConnectionRegistry.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace inventory {
namespace server {

namespace net = boost::asio;
using json = nlohmann::json;

/**
 * Decoded start_upload command
 */
struct StartCommand {
    std::vector<ingest::RawRow> rows;
    ingest::ResolutionPolicy policy = ingest::ResolutionPolicy::Skip;

    /**
     * Throws std::invalid_argument when `rows` is missing or not an array of
     * objects, or `duplicate_action` is not skip/update/create_new.
     * An empty `rows` array is accepted here and rejected by runImport().
     */
    static StartCommand fromJson(const json& message);
};

struct ImportOptions {
    /// Pause at stage boundaries so a client can follow the progress
    std::chrono::milliseconds stageDelay{300};
};

/**
 * Receives commands from duplex channels and runs imports.
 *
 * Imports run on the worker executor, serialized per channel: a second
 * start_upload on the same channel waits for the first. Different channels
 * import concurrently. ping is answered on the caller's thread right away,
 * whether or not an import is running.
 */
class ImportController {
public:
    using WorkerExecutor = net::thread_pool::executor_type;

    ImportController(ConnectionRegistry& registry,
                     catalog::CatalogStoreFactory storeFactory,
                     WorkerExecutor workers,
                     ImportOptions options = {});

    ImportController(const ImportController&) = delete;
    ImportController& operator=(const ImportController&) = delete;

    /**
     * Dispatch one inbound text message
     */
    void handleMessage(const ChannelPtr& channel, const std::string& text);

    /**
     * Forget the channel's serial queue. Work already queued still runs;
     * its events are dropped by the registry.
     */
    void onChannelClosed(const std::string& channelId);

    /**
     * Run one import synchronously on the calling thread, emitting every
     * event through the registry. Returns the terminal state.
     */
    ingest::ImportState runImport(const std::string& channelId, const StartCommand& command);

    size_t activeChannelQueues() const;

private:
    using ChannelStrand = net::strand<WorkerExecutor>;

    ChannelStrand strandFor(const std::string& channelId);
    void emitProgress(const std::string& channelId, ingest::ImportSession& session,
                      const std::string& step, int percent, const std::string& message,
                      json data = nullptr);
    void pace() const;

    ConnectionRegistry& m_registry;
    catalog::CatalogStoreFactory m_storeFactory;
    WorkerExecutor m_workers;
    ImportOptions m_options;

    std::unordered_map<std::string, ChannelStrand> m_strands;
    mutable std::mutex m_mutex;
};

} // namespace server
} // namespace inventory
