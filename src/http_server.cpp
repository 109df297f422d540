#include "http_server.hpp"
#include "config.hpp"
#include "log.hpp"
#include "request_handler.hpp"
#include <httplib.h>

namespace blackhole {

// Copies a handler result onto the httplib response.
static void write_response(const Response& result, httplib::Response& res) {
    res.status = result.status;
    res.set_content(result.body, result.content_type);
}

HttpServer::HttpServer(RequestHandler& handler, int threads)
    : handler_(handler), threads_(threads), server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

HttpServer::~HttpServer() = default;

void HttpServer::register_routes() {
    httplib::Server& svr = *server_;

    int threads = threads_;
    svr.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };

    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        write_response(handler_.handle_index(), res);
    });

    // Everything after the prefix, '/' included, is the asset path.
    svr.Get(std::string(STATIC_PREFIX) + "(.*)", [this](const httplib::Request& req, httplib::Response& res) {
        std::string path = req.matches[1];
        write_response(handler_.handle(path), res);
    });

    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content(res.status == 404 ? std::string("Not Found") : "Error " + std::to_string(res.status),
                            "text/plain");
        }
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::string line = req.method + " " + req.path + " -> " + std::to_string(res.status) +
                           " (" + std::to_string(res.body.size()) + " bytes)";
        if (res.status >= 500) {
            log_error("HTTP", line);
        } else if (res.status >= 400) {
            log_warn("HTTP", line);
        } else {
            log_info("HTTP", line);
        }
    });
}

bool HttpServer::start(const std::string& address, int port) {
    int bound = bind(address, port);
    if (bound < 0) {
        return false;
    }

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, bound);
    }

    // This blocks until server is stopped
    return listen();
}

int HttpServer::bind(const std::string& address, int port) {
    int bound = port;
    if (port == 0) {
        bound = server_->bind_to_any_port(address);
    } else if (!server_->bind_to_port(address, port)) {
        bound = -1;
    }
    if (bound < 0) {
        log_error("HTTP", "Failed to bind " + address + ":" + std::to_string(port));
    }
    return bound;
}

bool HttpServer::listen() {
    return server_->listen_after_bind();
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

void HttpServer::stop() {
    server_->stop();
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

} // namespace blackhole
