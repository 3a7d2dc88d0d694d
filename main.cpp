#include "catalog/PostgresCatalogStore.hpp"
#include "catalog/SqliteCatalogStore.hpp"
#include "server/ConnectionRegistry.hpp"
#include "server/HttpServer.hpp"
#include "server/ImportController.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "server/RequestHandler.hpp"
#include "server/ServerConfig.hpp"
#include <csignal>
#include <functional>
#include <iostream>

using namespace inventory::server;
namespace catalog = inventory::catalog;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    try {
        ServerConfig config = ServerConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << ServerConfig::helpText(argv[0]);
            return 0;
        }

        // Configure Logger
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }
        Logger::instance().setLogChannels(config.logChannels);

        // Configure Profiler
        Profiler::instance().setEnabled(config.profiler);

        std::cout << "=== InventoryServer ===" << std::endl;
        std::cout << std::endl;

        // Catalog backend: one store per import session / request
        catalog::CatalogStoreFactory storeFactory;
        if (config.usesPostgres()) {
            std::string connString = catalog::PostgresCatalogStore::resolveConnectionString(config.postgres);
            storeFactory = catalog::PostgresCatalogStore::factory(connString);
            LOG_INFO("Catalog backend: PostgreSQL");
        } else {
            storeFactory = catalog::SqliteCatalogStore::factory(config.databasePath);
            LOG_INFO("Catalog backend: SQLite (" + config.databasePath + ")");
        }

        // Open once up front: creates the schema and surfaces connection errors
        storeFactory();

        net::io_context ioc{1};
        net::thread_pool workers(config.workers);

        ConnectionRegistry registry;
        ImportController controller(registry, storeFactory, workers.get_executor(),
                                    ImportOptions{config.stageDelay});
        RequestHandler handler(storeFactory, config.maxUploadBytes());
        ServerContext context{registry, controller, handler};

        HttpServer server(ioc, config.address, config.port, context);
        server.run();

        shutdown_handler = [&]() {
            LOG_INFO("Shutting down...");
            server.stop();
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        LOG_INFO("Import workers: " + std::to_string(config.workers));

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /health                       - Health check" << std::endl;
        std::cout << "  GET  /products                     - List products" << std::endl;
        std::cout << "  POST /products                     - Create a product" << std::endl;
        std::cout << "  GET  /products/filter?min_price=X  - Products priced at least X" << std::endl;
        std::cout << "  GET  /products/low-stock           - Products below a stock threshold" << std::endl;
        std::cout << "  GET  /products/high-stock          - Products with the most stock" << std::endl;
        std::cout << "  GET|PUT|DELETE /products/:id       - Single product" << std::endl;
        std::cout << std::endl;
        std::cout << "  POST /upload/analyze               - Validate every sheet of an upload" << std::endl;
        std::cout << "  POST /upload/preview               - Normalized preview of one sheet" << std::endl;
        std::cout << "  POST /upload/validate-duplicates   - Duplicate check against the catalog" << std::endl;
        std::cout << "  WS   /ws/upload                    - Streaming import channel" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        ioc.run();

        // Let running imports finish their current work before exiting
        workers.join();

        if (Profiler::instance().isEnabled()) {
            std::cout << Profiler::instance().formatStats() << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
