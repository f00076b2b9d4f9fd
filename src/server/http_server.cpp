#include "server/http_server.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace apipipe {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

ApiRequest to_api_request(const httplib::Request& req) {
    ApiRequest request(req.method, req.path);
    request.body = req.body;
    request.remote_addr = req.remote_addr;

    const auto q = req.target.find('?');
    if (q != std::string::npos) request.query = req.target.substr(q + 1);

    // Repeated headers are folded into one comma-separated value
    for (const auto& [name, value] : req.headers) {
        auto [it, inserted] = request.headers.try_emplace(name, value);
        if (!inserted) {
            it->second += ", ";
            it->second += value;
        }
    }
    return request;
}

void write_response(const ApiResponse& response, httplib::Response& res) {
    res.status = response.status;
    for (const auto& [name, value] : response.headers) {
        res.set_header(name, value);
    }
    if (!response.body.empty()) {
        res.set_content(response.body, response.content_type);
    }
}

} // anonymous namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline, ServerConfig config)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)),
      logger_(logging::get_logger("api_pipeline.server")),
      server_(std::make_unique<httplib::Server>()) {
    if (!pipeline_) throw std::invalid_argument("HttpServer: pipeline is required");
}

HttpServer::~HttpServer() = default;

void HttpServer::handle(const httplib::Request& req, httplib::Response& res) {
    const auto request = to_api_request(req);
    try {
        write_response(pipeline_->execute(request), res);
    } catch (const std::exception& e) {
        logger_.error(std::format("Unhandled error: {} {}", request.method, request.path),
                      {{"error", e.what()}});
        write_response(ApiResponse::detail(500, "Internal server error", ErrorCode::INTERNAL_ERROR), res);
    }
}

// ============================================================================
// start(): registers the catch-all routes and listens
// ============================================================================

void HttpServer::start() {
    auto& svr = *server_;

    // Configure thread pool size
    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    const auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };
    const std::string any_path = ".*";
    svr.Get(any_path, dispatch);
    svr.Post(any_path, dispatch);
    svr.Put(any_path, dispatch);
    svr.Patch(any_path, dispatch);
    svr.Delete(any_path, dispatch);
    svr.Options(any_path, dispatch);

    logger_.info(std::format("Starting API pipeline server on {}:{} ({} threads)",
                             config_.host, config_.port, config_.thread_pool_size));

    running_.store(true, std::memory_order_release);
    const bool ok = svr.listen(config_.host, static_cast<int>(config_.port));
    running_.store(false, std::memory_order_release);
    if (!ok) {
        throw std::runtime_error(
            std::format("Failed to start HTTP server on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    server_->stop();
    logger_.info("Server stopped");
}

} // namespace apipipe
