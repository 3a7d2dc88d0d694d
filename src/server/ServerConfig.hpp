#pragma once

#include "server/Logger.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace inventory {
namespace server {

/**
 * Process configuration, from the command line and an optional
 * key=value file. Command line options win over the file.
 */
struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::string databasePath = "inventory.db";
    std::string postgres;                        // connection string or @file; empty selects SQLite
    size_t workers = 4;
    std::chrono::milliseconds stageDelay{300};
    size_t maxUploadMb = 10;
    bool profiler = true;
    bool logChannels = true;                     // one DEBUG line per channel message
    bool showHelp = false;

    size_t maxUploadBytes() const { return maxUploadMb * 1024 * 1024; }
    bool usesPostgres() const { return !postgres.empty(); }

    /**
     * Throws std::invalid_argument on unknown options, missing values,
     * bad numbers or an unreadable --config file
     */
    static ServerConfig fromArgs(int argc, const char* const argv[]);

    /**
     * Apply one setting by its file key (address, port, log_level, log_file,
     * database, postgres, workers, stage_delay_ms, max_upload_mb, profiler,
     * log_channels)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * Apply every entry of a key=value file; a leading '@' is stripped
     */
    void loadFile(const std::string& path);

    /**
     * key=value lines; blank lines and '#' comments skipped, keys and
     * values trimmed
     */
    static std::map<std::string, std::string> readKeyValueFile(const std::string& path);

    static std::string helpText(const std::string& program);
};

} // namespace server
} // namespace inventory
