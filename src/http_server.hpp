#pragma once

/**
 * HTTP server for the blackhole asset router.
 *
 * Routes GET /static/... into RequestHandler and GET / to the index page.
 * Every other path is answered with 404.
 */

#include <string>
#include <functional>
#include <memory>

namespace httplib {
class Server;
}

namespace blackhole {

class RequestHandler;

/**
 * HTTP front end. Requests run concurrently on httplib's thread pool.
 */
class HttpServer {
public:
    // Creates a server dispatching to the given handler, which must outlive it.
    HttpServer(RequestHandler& handler, int threads);

    ~HttpServer();

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if server started successfully, false otherwise.
    bool start(const std::string& address, int port);

    // Binds without serving. Port 0 picks a free port.
    // Returns the bound port, or -1 on failure.
    int bind(const std::string& address, int port);

    // Serves on the bound socket until stop(). Returns false on failure.
    bool listen();

    bool is_running() const;

    // Stops a running server; start() then returns.
    void stop();

    // Sets a callback to be called when the server starts.
    void on_start(std::function<void(const std::string&, int)> callback);

private:
    void register_routes();

    RequestHandler& handler_;
    int threads_;
    std::unique_ptr<httplib::Server> server_;
    std::function<void(const std::string&, int)> on_start_callback_;
};

} // namespace blackhole
