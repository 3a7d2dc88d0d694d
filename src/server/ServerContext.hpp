#pragma once

namespace inventory {
namespace server {

class ConnectionRegistry;
class ImportController;
class RequestHandler;

/**
 * Shared services handed to every connection. Owned by main(), outlives
 * the server.
 */
struct ServerContext {
    ConnectionRegistry& registry;
    ImportController& controller;
    RequestHandler& handler;
};

} // namespace server
} // namespace inventory
