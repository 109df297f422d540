#include <catch2/catch.hpp>
#include "http_server.hpp"
#include "request_handler.hpp"
#include "test_helpers.hpp"
#include <httplib.h>
#include <chrono>
#include <thread>

using namespace blackhole;
using namespace blackhole::testing;

// Runs an HttpServer over a RequestHandler rooted in a temp dir.
class RunningServer {
public:
    explicit RunningServer(const TempDir& dir) : settings_(make_settings(dir)), handler_(settings_, fetcher_), server_(handler_, 2) {
        port_ = server_.bind("127.0.0.1", 0);
        REQUIRE(port_ > 0);
        thread_ = std::thread([this]() { server_.listen(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~RunningServer() {
        server_.stop();
        thread_.join();
    }

    RunningServer(const RunningServer&) = delete;
    RunningServer& operator=(const RunningServer&) = delete;

    httplib::Client client() const { return httplib::Client("127.0.0.1", port_); }

    FakeFetcher& fetcher() { return fetcher_; }

private:
    static Settings make_settings(const TempDir& dir) {
        Settings settings;
        settings.proxy.enabled = true;
        settings.proxy.static_dir = (dir / "static").string();
        settings.proxy.cache_dir = (dir / "cache").string();
        settings.server.index_file = (dir / "ui/index.html").string();
        fs::create_directories(settings.proxy.static_dir);
        fs::create_directories(settings.proxy.cache_dir);
        return settings;
    }

    Settings settings_;
    FakeFetcher fetcher_;
    RequestHandler handler_;
    HttpServer server_;
    std::thread thread_;
    int port_ = -1;
};

TEST_CASE("Static route serves local files with their content type", "[server]") {
    TempDir dir;
    write_file(dir / "static/github.css", "body {}");
    RunningServer server(dir);
    auto client = server.client();

    auto res = client.Get("/static/github.css");

    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "body {}");
    REQUIRE(res->get_header_value("Content-Type") == "text/css");
}

TEST_CASE("Static route passes nested package paths through", "[server]") {
    TempDir dir;
    RunningServer server(dir);
    server.fetcher().bodies["vue@3.2.0/dist/vue.js"] = "var Vue;";
    auto client = server.client();

    auto res = client.Get("/static/vue@3.2.0/dist/vue.js");

    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "var Vue;");
    REQUIRE(res->get_header_value("Content-Type") == "application/javascript");
    REQUIRE(read_file(dir / "cache/vue/3.2.0/dist/vue.js") == "var Vue;");
}

TEST_CASE("Root serves the index page", "[server]") {
    TempDir dir;
    write_file(dir / "ui/index.html", "<h1>home</h1>");
    RunningServer server(dir);
    auto client = server.client();

    auto res = client.Get("/");

    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "<h1>home</h1>");
    REQUIRE(res->get_header_value("Content-Type") == "text/html; charset=utf-8");
}

TEST_CASE("Unrouted path is 404", "[server]") {
    TempDir dir;
    RunningServer server(dir);
    auto client = server.client();

    auto res = client.Get("/other");

    REQUIRE(res);
    REQUIRE(res->status == 404);
    REQUIRE(res->body == "Not Found");
}

TEST_CASE("Handler errors reach the client unchanged", "[server]") {
    TempDir dir;
    RunningServer server(dir);
    auto client = server.client();

    auto missing = client.Get("/static/missing.css");
    auto upstream = client.Get("/static/nopkg@1.0.0/x.js");

    REQUIRE(missing);
    REQUIRE(missing->status == 404);
    REQUIRE(upstream);
    REQUIRE(upstream->status == 502);
    REQUIRE(upstream->get_header_value("Content-Type") == "text/plain");
}
