#include "server/ServerConfig.hpp"
#include "catalog/FieldValidators.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace inventory {
namespace server {

namespace {

unsigned long long parseUnsigned(const std::string& key, const std::string& value,
                                 unsigned long long maxValue) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || parsed > maxValue) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return parsed;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = catalog::normalizeName(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": '" + value + "'");
}

// Long option (without leading dashes) and short alias -> file key
const std::map<std::string, std::string>& optionKeys() {
    static const std::map<std::string, std::string> keys = {
        {"-a", "address"},           {"--address", "address"},
        {"-p", "port"},              {"--port", "port"},
        {"-l", "log_level"},         {"--log-level", "log_level"},
        {"--log-file", "log_file"},
        {"-d", "database"},          {"--database", "database"},
        {"--postgres", "postgres"},
        {"--workers", "workers"},
        {"--stage-delay-ms", "stage_delay_ms"},
        {"--max-upload-mb", "max_upload_mb"},
    };
    return keys;
}

} // anonymous namespace

void ServerConfig::set(const std::string& key, const std::string& value) {
    if (key == "address") {
        if (value.empty()) throw std::invalid_argument("Empty address");
        address = value;
    } else if (key == "port") {
        port = static_cast<unsigned short>(parseUnsigned(key, value, 65535));
    } else if (key == "log_level") {
        logLevel = Logger::parseLevel(value);
    } else if (key == "log_file") {
        logFile = value;
    } else if (key == "database") {
        if (value.empty()) throw std::invalid_argument("Empty database path");
        databasePath = value;
    } else if (key == "postgres") {
        postgres = value;
    } else if (key == "workers") {
        workers = static_cast<size_t>(parseUnsigned(key, value, 1024));
        if (workers == 0) throw std::invalid_argument("workers must be at least 1");
    } else if (key == "stage_delay_ms") {
        stageDelay = std::chrono::milliseconds(parseUnsigned(key, value, 60000));
    } else if (key == "max_upload_mb") {
        maxUploadMb = static_cast<size_t>(parseUnsigned(key, value, 4096));
        if (maxUploadMb == 0) throw std::invalid_argument("max_upload_mb must be at least 1");
    } else if (key == "profiler") {
        profiler = parseBool(key, value);
    } else if (key == "log_channels") {
        logChannels = parseBool(key, value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

std::map<std::string, std::string> ServerConfig::readKeyValueFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }

    std::map<std::string, std::string> entries;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = catalog::trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(path + ":" + std::to_string(lineNumber) +
                                        ": expected key=value");
        }
        entries[catalog::trim(line.substr(0, eq))] = catalog::trim(line.substr(eq + 1));
    }
    return entries;
}

void ServerConfig::loadFile(const std::string& path) {
    std::string resolved = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    for (const auto& [key, value] : readKeyValueFile(resolved)) {
        set(key, value);
    }
}

ServerConfig ServerConfig::fromArgs(int argc, const char* const argv[]) {
    ServerConfig config;

    auto valueAt = [&](int i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + option);
        }
        return argv[i + 1];
    };

    // The file first, so that the command line overrides it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config.loadFile(valueAt(i, "--config"));
            ++i;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "--no-profiler") {
            config.profiler = false;
        } else if (arg == "--no-channel-log") {
            config.logChannels = false;
        } else if (arg == "--config") {
            ++i;
        } else {
            auto it = optionKeys().find(arg);
            if (it == optionKeys().end()) {
                throw std::invalid_argument("Unknown option: " + arg);
            }
            config.set(it->second, valueAt(i, arg));
            ++i;
        }
    }

    return config;
}

std::string ServerConfig::helpText(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -a, --address ADDR     Address to bind to (default: 0.0.0.0)\n"
        << "  -p, --port PORT        Port to listen on (default: 8080)\n"
        << "  -d, --database PATH    SQLite catalog file (default: inventory.db)\n"
        << "  --postgres CONN        Use PostgreSQL instead of SQLite\n"
        << "                         String: \"host=localhost port=5432 dbname=inventory user=postgres\"\n"
        << "                         File: @/path/to/postgres.conf (one param per line)\n"
        << "  --workers N            Import worker threads (default: 4)\n"
        << "  --stage-delay-ms N     Pause between import stages (default: 300)\n"
        << "  --max-upload-mb N      Upload size limit for the analysis endpoints (default: 10)\n"
        << "  --config FILE          key=value settings file (@file syntax accepted)\n"
        << "  -l, --log-level LVL    Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH        Append logs to a file instead of stdout\n"
        << "  --no-channel-log       Do not log channel messages at debug level\n"
        << "  --no-profiler          Disable profiler\n"
        << "  -h, --help             Show this help\n";
    return out.str();
}

} // namespace server
} // namespace inventory
