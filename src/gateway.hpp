#pragma once
#include "config.hpp"
#include "context_retriever.hpp"
#include "rate_limiter.hpp"
#include "store_registry.hpp"
#include <httplib.h>
#include <string>
#include <thread>

namespace convmem {

/**
 * HTTP surface over a StoreRegistry.
 *
 *   GET  /health
 *   POST /conversations/{id}/turns     ConversationTurn JSON
 *   POST /conversations/{id}/search    {query, k, exclude, tables}
 *   GET  /conversations/{id}/recent?n=
 *   POST /conversations/{id}/context   {question, tables}
 *   POST /clear/{id}, POST /clear      ("default" conversation)
 */
class MemoryGateway {
public:
    MemoryGateway(StoreRegistry& registry, const Config& cfg);
    ~MemoryGateway();

    MemoryGateway(const MemoryGateway&) = delete;
    MemoryGateway& operator=(const MemoryGateway&) = delete;

    // Binds and starts serving on a background thread. Port 0 picks a free port.
    bool start(const std::string& host, int port);
    void stop();

    int port() const { return port_; }

private:
    StoreRegistry& registry_;
    Config config_;
    httplib::Server server_;
    std::thread thread_;
    RateLimiter rate_limiter_;
    std::string host_;
    int port_ = 0;

    void setup_routes();
    bool check_auth(const httplib::Request& req, httplib::Response& res);
    bool check_rate_limit(const httplib::Request& req, httplib::Response& res);
    EmbedOptions embed_options() const;
};

// `convmem serve`: runs the gateway until SIGINT/SIGTERM.
int cmd_serve(const std::string& config_path, const std::string& host, int port);

} // namespace convmem
