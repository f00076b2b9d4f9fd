#pragma once

#include "config/config_types.hpp"
#include "core/pipeline.hpp"
#include "logging/logger.hpp"

#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace apipipe {

/**
 * @brief HTTP host for the pipeline
 *
 * Every request, whatever its method or path, is converted to an ApiRequest
 * and run through the pipeline on a cpp-httplib worker thread. Exceptions
 * escaping the pipeline become 500 {"detail": "Internal server error"}.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks until stop() is called
    /// @throws std::runtime_error if the socket cannot be bound
    void start();

    /// Safe to call from another thread or a signal handler thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Run one request through the pipeline, converting failures to 500
    void handle(const httplib::Request& req, httplib::Response& res);

private:
    std::shared_ptr<Pipeline> pipeline_;
    const ServerConfig config_;
    logging::Logger& logger_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
};

} // namespace apipipe
