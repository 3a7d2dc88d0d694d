#include <catch2/catch_test_macros.hpp>
#include "server/ServerConfig.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

using namespace inventory::server;

namespace {

ServerConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "inventory_server");
    return ServerConfig::fromArgs(static_cast<int>(args.size()), args.data());
}

// Helper to create a temporary config file
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content)
        : m_path("/tmp/test_inventory_config_" + std::to_string(std::rand()) + ".conf") {
        std::ofstream out(m_path);
        out << content;
    }

    ~TempConfigFile() {
        std::remove(m_path.c_str());
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // anonymous namespace

TEST_CASE("Defaults", "[ServerConfig]") {
    auto config = parse({});

    CHECK(config.address == "0.0.0.0");
    CHECK(config.port == 8080);
    CHECK(config.logLevel == LogLevel::INFO);
    CHECK(config.databasePath == "inventory.db");
    CHECK_FALSE(config.usesPostgres());
    CHECK(config.workers == 4);
    CHECK(config.stageDelay == std::chrono::milliseconds(300));
    CHECK(config.maxUploadBytes() == 10u * 1024 * 1024);
    CHECK(config.profiler);
    CHECK(config.logChannels);
    CHECK_FALSE(config.showHelp);
}

TEST_CASE("Command line options", "[ServerConfig]") {
    auto config = parse({"-a", "127.0.0.1", "--port", "9000", "-l", "debug",
                         "-d", "/tmp/cat.db", "--workers", "8", "--stage-delay-ms", "0",
                         "--max-upload-mb", "2", "--no-profiler", "--no-channel-log", "--log-file", "/tmp/inv.log",
                         "--postgres", "host=db"});

    CHECK(config.address == "127.0.0.1");
    CHECK(config.port == 9000);
    CHECK(config.logLevel == LogLevel::DEBUG);
    CHECK(config.databasePath == "/tmp/cat.db");
    CHECK(config.workers == 8);
    CHECK(config.stageDelay == std::chrono::milliseconds(0));
    CHECK(config.maxUploadBytes() == 2u * 1024 * 1024);
    CHECK_FALSE(config.profiler);
    CHECK_FALSE(config.logChannels);
    CHECK(config.logFile == "/tmp/inv.log");
    CHECK(config.usesPostgres());
    CHECK(config.postgres == "host=db");

    CHECK(parse({"-h"}).showHelp);
}

TEST_CASE("Bad options throw invalid_argument", "[ServerConfig]") {
    CHECK_THROWS_AS(parse({"--port"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--port", "http"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--port", "70000"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--workers", "0"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--workers", "-2"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--log-level", "verbose"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--frobnicate"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"--config", "/nonexistent/inventory.conf"}), std::invalid_argument);
}

TEST_CASE("Config file values, overridden by the command line", "[ServerConfig]") {
    TempConfigFile file(
        "# inventory server\n"
        "\n"
        "  port = 7000  \n"
        "database=/tmp/from_file.db\n"
        "workers = 2\n"
        "profiler = off\n"
        "log_channels = no\n"
        "log_level = warn\n");

    auto fromFile = parse({"--config", file.path().c_str()});
    CHECK(fromFile.port == 7000);
    CHECK(fromFile.databasePath == "/tmp/from_file.db");
    CHECK(fromFile.workers == 2);
    CHECK_FALSE(fromFile.profiler);
    CHECK_FALSE(fromFile.logChannels);
    CHECK(fromFile.logLevel == LogLevel::WARN);

    std::string atPath = "@" + file.path();
    auto overridden = parse({"-p", "7100", "--config", atPath.c_str()});
    CHECK(overridden.port == 7100);
    CHECK(overridden.workers == 2);
}

TEST_CASE("Config file errors", "[ServerConfig]") {
    TempConfigFile unknownKey("colour=blue\n");
    CHECK_THROWS_AS(parse({"--config", unknownKey.path().c_str()}), std::invalid_argument);

    TempConfigFile noEquals("port 8080\n");
    CHECK_THROWS_AS(parse({"--config", noEquals.path().c_str()}), std::invalid_argument);

    TempConfigFile badBool("profiler=maybe\n");
    CHECK_THROWS_AS(parse({"--config", badBool.path().c_str()}), std::invalid_argument);
}

TEST_CASE("Help text lists every option", "[ServerConfig]") {
    auto help = ServerConfig::helpText("inventory_server");
    for (const char* option : {"--address", "--port", "--database", "--postgres", "--workers",
                               "--stage-delay-ms", "--max-upload-mb", "--config", "--log-level",
                               "--log-file", "--no-channel-log", "--no-profiler", "--help"}) {
        CHECK(help.find(option) != std::string::npos);
    }
}
